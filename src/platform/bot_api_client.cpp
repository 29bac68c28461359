#include "../../include/platform/bot_api_client.hpp"
#include "../../include/platform/error_classifier.hpp"
#include "../../include/utils/logger.hpp"

#include <curl/curl.h>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>

namespace postsched {

namespace pt = boost::property_tree;

namespace {

// VK error 27: the token is a community token, groups.get is not available.
constexpr int kVkGroupAuthFailed = 27;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total);
    return total;
}

bool parseJson(const std::string& body, pt::ptree& out) {
    try {
        std::stringstream ss(body);
        pt::read_json(ss, out);
        return true;
    } catch (const pt::json_parser_error&) {
        return false;
    }
}

void readVkGroups(const pt::ptree& list, std::vector<ChannelTarget>& out) {
    for (const auto& child : list) {
        const pt::ptree& g = child.second;
        ChannelTarget t;
        t.platform = Platform::Vk;
        t.external_id = g.get<int64_t>("id", 0);
        t.title = g.get<std::string>("name", "");
        t.can_post = g.get<int>("can_post", 1) != 0;
        if (t.external_id > 0) out.push_back(t);
    }
}

} // namespace

BotApiClient::BotApiClient(const BotApiSettings& settings)
    : settings_(settings) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

BotApiClient::~BotApiClient() {
    curl_global_cleanup();
}

BotApiClient::HttpResponse BotApiClient::post(const std::string& url,
                                              const std::map<std::string, std::string>& form,
                                              long timeout_seconds) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    std::string body;
    for (const auto& kv : form) {
        char* key = curl_easy_escape(curl, kv.first.c_str(), static_cast<int>(kv.first.size()));
        char* value = curl_easy_escape(curl, kv.second.c_str(), static_cast<int>(kv.second.size()));
        if (key && value) {
            if (!body.empty()) body += "&";
            body += key;
            body += "=";
            body += value;
        }
        curl_free(key);
        curl_free(value);
    }

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    response.transport_ok = (res == CURLE_OK);
    if (!response.transport_ok) {
        response.transport_error = curl_easy_strerror(res);
        response.status = 0;
    }
    return response;
}

BotApiClient::HttpResponse BotApiClient::get(const std::string& url, long timeout_seconds) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_easy_cleanup(curl);

    response.transport_ok = (res == CURLE_OK);
    if (!response.transport_ok) {
        response.transport_error = curl_easy_strerror(res);
        response.status = 0;
    }
    return response;
}

BotApiClient::HttpResponse BotApiClient::upload(const std::string& url, const std::string& field,
                                                const std::string& filename, const std::string& data) {
    HttpResponse response;
    CURL* curl = curl_easy_init();
    if (!curl) {
        response.transport_error = "curl_easy_init failed";
        return response;
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, field.c_str());
    curl_mime_filename(part, filename.c_str());
    curl_mime_data(part, data.data(), data.size());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout_seconds) * 4);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    response.transport_ok = (res == CURLE_OK);
    if (!response.transport_ok) {
        response.transport_error = curl_easy_strerror(res);
        response.status = 0;
    }
    return response;
}

// ========== TELEGRAM ==========

DeliveryResult BotApiClient::callTelegram(const std::string& method,
                                          const std::map<std::string, std::string>& form,
                                          long timeout_seconds,
                                          std::string& result_body) {
    const std::string url = settings_.telegram_base_url + "/bot" + settings_.telegram_token + "/" + method;
    HttpResponse response = post(url, form, timeout_seconds);
    if (!response.transport_ok) {
        return DeliveryResult::failure(DeliveryError::Transient, method + ": " + response.transport_error);
    }

    pt::ptree root;
    const bool parsed = parseJson(response.body, root);
    if (parsed && root.get<bool>("ok", false)) {
        result_body = std::move(response.body);
        return DeliveryResult::success("");
    }

    std::string description = parsed ? root.get<std::string>("description", "") : "";
    if (description.empty()) description = "HTTP " + std::to_string(response.status);
    return DeliveryResult::failure(classifyTelegramError(response.status, description),
                                   method + ": " + description);
}

DeliveryResult BotApiClient::telegramMessageCall(const std::string& method,
                                                 const SourceRef& source,
                                                 const ChannelTarget& target) {
    std::map<std::string, std::string> form;
    form["chat_id"] = std::to_string(target.external_id);
    form["from_chat_id"] = std::to_string(source.chat_id);
    form["message_id"] = std::to_string(source.message_id);

    std::string body;
    DeliveryResult result = callTelegram(method, form, settings_.timeout_seconds, body);
    if (!result.ok()) return result;

    pt::ptree root;
    if (parseJson(body, root)) {
        result.message_ref = root.get<std::string>("result.message_id", "");
    }
    return result;
}

DeliveryResult BotApiClient::forward(const SourceRef& source, const ChannelTarget& target) {
    return telegramMessageCall("forwardMessage", source, target);
}

DeliveryResult BotApiClient::copy(const SourceRef& source, const ChannelTarget& target) {
    return telegramMessageCall("copyMessage", source, target);
}

bool BotApiClient::sendText(int64_t chat_id, const std::string& text,
                            const std::string& reply_markup_json,
                            const std::string& parse_mode) {
    std::map<std::string, std::string> form;
    form["chat_id"] = std::to_string(chat_id);
    form["text"] = text;
    if (!reply_markup_json.empty()) form["reply_markup"] = reply_markup_json;
    if (!parse_mode.empty()) form["parse_mode"] = parse_mode;

    std::string body;
    DeliveryResult result = callTelegram("sendMessage", form, settings_.timeout_seconds, body);
    if (!result.ok()) {
        Logger::getInstance().warning("sendMessage to " + std::to_string(chat_id) + " failed: " + result.detail);
        return false;
    }
    return true;
}

bool BotApiClient::answerCallback(const std::string& callback_id, const std::string& text) {
    std::map<std::string, std::string> form;
    form["callback_query_id"] = callback_id;
    if (!text.empty()) form["text"] = text;

    std::string body;
    DeliveryResult result = callTelegram("answerCallbackQuery", form, settings_.timeout_seconds, body);
    if (!result.ok()) {
        Logger::getInstance().warning("answerCallbackQuery failed: " + result.detail);
        return false;
    }
    return true;
}

bool BotApiClient::getUpdates(int64_t offset, int timeout_seconds, std::vector<Update>& out) {
    std::map<std::string, std::string> form;
    form["offset"] = std::to_string(offset);
    form["timeout"] = std::to_string(timeout_seconds);
    form["allowed_updates"] = "[\"message\",\"callback_query\",\"my_chat_member\"]";

    // Long polling holds the request open for up to `timeout_seconds`.
    std::string body;
    DeliveryResult result = callTelegram("getUpdates", form,
                                         timeout_seconds + settings_.timeout_seconds, body);
    if (!result.ok()) {
        Logger::getInstance().warning("getUpdates failed: " + result.detail);
        return false;
    }

    std::string error;
    if (!parseUpdates(body, out, error)) {
        Logger::getInstance().warning("getUpdates: " + error);
        return false;
    }
    return true;
}

// ========== VK ==========

DeliveryResult BotApiClient::callVk(const std::string& method,
                                    std::map<std::string, std::string> form,
                                    std::string& result_body,
                                    int& vk_error_code) {
    vk_error_code = 0;
    if (settings_.vk_token.empty()) {
        return DeliveryResult::failure(DeliveryError::Other, "VK is not configured");
    }
    form["access_token"] = settings_.vk_token;
    form["v"] = settings_.vk_api_version;

    HttpResponse response = post(settings_.vk_base_url + "/" + method, form, settings_.timeout_seconds);
    if (!response.transport_ok) {
        return DeliveryResult::failure(DeliveryError::Transient, method + ": " + response.transport_error);
    }
    if (response.status >= 500) {
        return DeliveryResult::failure(DeliveryError::Transient,
                                       method + ": HTTP " + std::to_string(response.status));
    }

    pt::ptree root;
    if (!parseJson(response.body, root)) {
        return DeliveryResult::failure(DeliveryError::Other,
                                       method + ": unparsable response, HTTP " + std::to_string(response.status));
    }
    if (auto err = root.get_child_optional("error")) {
        vk_error_code = err->get<int>("error_code", 0);
        const std::string msg = err->get<std::string>("error_msg", "unknown error");
        return DeliveryResult::failure(classifyVkError(vk_error_code),
                                       method + ": " + std::to_string(vk_error_code) + " " + msg);
    }
    result_body = std::move(response.body);
    return DeliveryResult::success("");
}

DeliveryResult BotApiClient::fetchTelegramFile(const std::string& file_id, std::string& bytes) {
    std::map<std::string, std::string> form;
    form["file_id"] = file_id;

    std::string body;
    DeliveryResult result = callTelegram("getFile", form, settings_.timeout_seconds, body);
    if (!result.ok()) return result;

    pt::ptree root;
    const std::string file_path = parseJson(body, root) ? root.get<std::string>("result.file_path", "") : "";
    if (file_path.empty()) {
        return DeliveryResult::failure(DeliveryError::Other, "getFile: no file_path in response");
    }

    const std::string url = settings_.telegram_base_url + "/file/bot" + settings_.telegram_token + "/" + file_path;
    HttpResponse response = get(url, settings_.timeout_seconds * 4);
    if (!response.transport_ok) {
        return DeliveryResult::failure(DeliveryError::Transient, "file download: " + response.transport_error);
    }
    if (response.status != 200) {
        const DeliveryError err = response.status >= 500 ? DeliveryError::Transient : DeliveryError::Other;
        return DeliveryResult::failure(err, "file download: HTTP " + std::to_string(response.status));
    }
    bytes = std::move(response.body);
    return DeliveryResult::success("");
}

DeliveryResult BotApiClient::uploadWallPhoto(const SourceRef& source, const ChannelTarget& target,
                                             std::string& attachment) {
    std::string bytes;
    DeliveryResult result = fetchTelegramFile(source.photo_file_id, bytes);
    if (!result.ok()) return result;

    const std::string group_id = std::to_string(target.external_id);
    std::map<std::string, std::string> form;
    form["group_id"] = group_id;

    std::string body;
    int vk_error = 0;
    result = callVk("photos.getWallUploadServer", form, body, vk_error);
    if (!result.ok()) return result;

    pt::ptree root;
    const std::string upload_url = parseJson(body, root) ? root.get<std::string>("response.upload_url", "") : "";
    if (upload_url.empty()) {
        return DeliveryResult::failure(DeliveryError::Other, "photos.getWallUploadServer: no upload_url");
    }

    HttpResponse uploaded = upload(upload_url, "photo", "photo.jpg", bytes);
    if (!uploaded.transport_ok) {
        return DeliveryResult::failure(DeliveryError::Transient, "photo upload: " + uploaded.transport_error);
    }
    pt::ptree upload_root;
    if (!parseJson(uploaded.body, upload_root)) {
        return DeliveryResult::failure(uploaded.status >= 500 ? DeliveryError::Transient : DeliveryError::Other,
                                       "photo upload: unparsable response, HTTP " + std::to_string(uploaded.status));
    }
    const std::string photo = upload_root.get<std::string>("photo", "");
    if (photo.empty() || photo == "[]") {
        return DeliveryResult::failure(DeliveryError::Other, "photo upload: server rejected the file");
    }

    std::map<std::string, std::string> save;
    save["group_id"] = group_id;
    save["server"] = upload_root.get<std::string>("server", "");
    save["photo"] = photo;
    save["hash"] = upload_root.get<std::string>("hash", "");
    result = callVk("photos.saveWallPhoto", save, body, vk_error);
    if (!result.ok()) return result;

    pt::ptree saved;
    if (!parseJson(body, saved)) {
        return DeliveryResult::failure(DeliveryError::Other, "photos.saveWallPhoto: unparsable response");
    }
    auto list = saved.get_child_optional("response");
    if (!list || list->empty()) {
        return DeliveryResult::failure(DeliveryError::Other, "photos.saveWallPhoto: empty response");
    }
    const pt::ptree& first = list->begin()->second;
    const std::string owner_id = first.get<std::string>("owner_id", "");
    const std::string id = first.get<std::string>("id", "");
    if (owner_id.empty() || id.empty()) {
        return DeliveryResult::failure(DeliveryError::Other, "photos.saveWallPhoto: no photo id");
    }
    attachment = "photo" + owner_id + "_" + id;
    return DeliveryResult::success("");
}

DeliveryResult BotApiClient::postToWall(const SourceRef& source, const ChannelTarget& target) {
    if (source.caption.empty() && source.photo_file_id.empty()) {
        return DeliveryResult::failure(DeliveryError::Other, "wall.post: source message has no text or photo");
    }

    const std::string owner = "-" + std::to_string(target.external_id);
    std::map<std::string, std::string> form;
    form["owner_id"] = owner;
    form["from_group"] = "1";
    if (!source.caption.empty()) form["message"] = source.caption;

    if (!source.photo_file_id.empty()) {
        std::string attachment;
        DeliveryResult uploaded = uploadWallPhoto(source, target, attachment);
        if (!uploaded.ok()) return uploaded;
        form["attachments"] = attachment;
    }

    std::string body;
    int vk_error = 0;
    DeliveryResult result = callVk("wall.post", form, body, vk_error);
    if (!result.ok()) return result;

    pt::ptree root;
    if (parseJson(body, root)) {
        const std::string post_id = root.get<std::string>("response.post_id", "");
        if (!post_id.empty()) result.message_ref = "wall" + owner + "_" + post_id;
    }
    return result;
}

bool BotApiClient::listVkGroups(std::vector<ChannelTarget>& out, std::string& error) {
    out.clear();

    std::map<std::string, std::string> form;
    form["filter"] = "admin";
    form["extended"] = "1";
    form["fields"] = "can_post";

    std::string body;
    int vk_error = 0;
    DeliveryResult result = callVk("groups.get", form, body, vk_error);

    if (!result.ok() && vk_error == kVkGroupAuthFailed && !settings_.vk_group_id.empty()) {
        Logger::getInstance().info("VK token is a community token, resolving group " + settings_.vk_group_id);
        std::map<std::string, std::string> by_id;
        by_id["group_id"] = settings_.vk_group_id;
        by_id["fields"] = "can_post";
        result = callVk("groups.getById", by_id, body, vk_error);
        if (!result.ok()) {
            error = result.detail;
            return false;
        }
        pt::ptree root;
        if (!parseJson(body, root)) {
            error = "groups.getById: unparsable response";
            return false;
        }
        // 5.199 wraps the list in "groups"; older versions return the array itself.
        if (auto groups = root.get_child_optional("response.groups")) {
            readVkGroups(*groups, out);
        } else if (auto list = root.get_child_optional("response")) {
            readVkGroups(*list, out);
        }
        return true;
    }

    if (!result.ok()) {
        error = result.detail;
        return false;
    }

    pt::ptree root;
    if (!parseJson(body, root)) {
        error = "groups.get: unparsable response";
        return false;
    }
    if (auto items = root.get_child_optional("response.items")) {
        readVkGroups(*items, out);
    }
    return true;
}

} // namespace postsched

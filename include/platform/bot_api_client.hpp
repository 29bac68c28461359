#ifndef POSTSCHED_BOT_API_CLIENT_HPP
#define POSTSCHED_BOT_API_CLIENT_HPP

#include <map>
#include <string>
#include <vector>
#include "platform_client.hpp"

namespace postsched {

struct BotApiSettings {
    std::string telegram_token;
    std::string vk_token;
    std::string vk_group_id;
    std::string vk_api_version = "5.199";
    int timeout_seconds = 15;

    std::string telegram_base_url = "https://api.telegram.org";
    std::string vk_base_url = "https://api.vk.com/method";
};

// Telegram Bot API and VK API over libcurl. Each call uses its own easy
// handle, so one instance may be shared between threads.
class BotApiClient : public PlatformClient {
public:
    explicit BotApiClient(const BotApiSettings& settings);
    ~BotApiClient() override;

    BotApiClient(const BotApiClient&) = delete;
    BotApiClient& operator=(const BotApiClient&) = delete;

    DeliveryResult forward(const SourceRef& source, const ChannelTarget& target) override;
    DeliveryResult copy(const SourceRef& source, const ChannelTarget& target) override;
    DeliveryResult postToWall(const SourceRef& source, const ChannelTarget& target) override;

    bool sendText(int64_t chat_id, const std::string& text,
                  const std::string& reply_markup_json = "",
                  const std::string& parse_mode = "") override;
    bool answerCallback(const std::string& callback_id, const std::string& text = "") override;
    bool getUpdates(int64_t offset, int timeout_seconds, std::vector<Update>& out) override;

    bool listVkGroups(std::vector<ChannelTarget>& out, std::string& error) override;

private:
    struct HttpResponse {
        bool transport_ok = false;
        long status = 0;
        std::string body;
        std::string transport_error;
    };

    HttpResponse post(const std::string& url, const std::map<std::string, std::string>& form,
                      long timeout_seconds);
    HttpResponse get(const std::string& url, long timeout_seconds);
    // Single-file multipart/form-data POST.
    HttpResponse upload(const std::string& url, const std::string& field,
                        const std::string& filename, const std::string& data);

    // Telegram method call. On success `result_body` holds the raw response.
    DeliveryResult callTelegram(const std::string& method,
                                const std::map<std::string, std::string>& form,
                                long timeout_seconds,
                                std::string& result_body);
    DeliveryResult telegramMessageCall(const std::string& method,
                                       const SourceRef& source,
                                       const ChannelTarget& target);

    // VK method call. `vk_error_code` is set when VK answered with an error object.
    DeliveryResult callVk(const std::string& method,
                          std::map<std::string, std::string> form,
                          std::string& result_body,
                          int& vk_error_code);

    // getFile plus download of the file body.
    DeliveryResult fetchTelegramFile(const std::string& file_id, std::string& bytes);
    // Moves the source photo to the group wall album; `attachment` gets "photo<owner>_<id>".
    DeliveryResult uploadWallPhoto(const SourceRef& source, const ChannelTarget& target,
                                   std::string& attachment);

    BotApiSettings settings_;
};

} // namespace postsched

#endif // POSTSCHED_BOT_API_CLIENT_HPP

#include "../../include/bot/updates.hpp"
#include "../../include/utils/logger.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>

namespace postsched {

namespace pt = boost::property_tree;

namespace {

void readMessage(const pt::ptree& m, IncomingMessage& out) {
    out.message_id = m.get<int64_t>("message_id", 0);
    out.chat_id = m.get<int64_t>("chat.id", 0);
    out.from_id = m.get<int64_t>("from.id", 0);
    out.from_username = m.get<std::string>("from.username", "");
    out.text = m.get<std::string>("text", "");
    if (out.text.empty()) out.text = m.get<std::string>("caption", "");

    // photo[] lists the sizes of one picture; keep the largest.
    if (auto photo = m.get_child_optional("photo")) {
        int64_t best_area = -1;
        for (const auto& size : *photo) {
            const int64_t area = size.second.get<int64_t>("width", 0) * size.second.get<int64_t>("height", 0);
            if (area >= best_area) {
                best_area = area;
                out.photo_file_id = size.second.get<std::string>("file_id", "");
            }
        }
    }

    // Bot API 7+ reports forwards through forward_origin, older payloads
    // through forward_from_chat / forward_from_message_id.
    if (auto origin = m.get_child_optional("forward_origin")) {
        out.forwarded = true;
        if (origin->get<std::string>("type", "") == "channel") {
            out.origin_chat_id = origin->get<int64_t>("chat.id", 0);
            out.origin_message_id = origin->get<int64_t>("message_id", 0);
        }
    } else if (m.get_child_optional("forward_from_chat")) {
        out.forwarded = true;
        out.origin_chat_id = m.get<int64_t>("forward_from_chat.id", 0);
        out.origin_message_id = m.get<int64_t>("forward_from_message_id", 0);
    } else if (m.get_child_optional("forward_from") || m.get_child_optional("forward_date")) {
        out.forwarded = true;
    }
}

} // namespace

bool parseUpdates(const std::string& body, std::vector<Update>& out, std::string& error) {
    out.clear();
    pt::ptree root;
    try {
        std::stringstream ss(body);
        pt::read_json(ss, root);
    } catch (const pt::json_parser_error& e) {
        error = std::string("malformed getUpdates response: ") + e.what();
        return false;
    }

    if (!root.get<bool>("ok", false)) {
        error = root.get<std::string>("description", "getUpdates failed");
        return false;
    }

    auto result = root.get_child_optional("result");
    if (!result) return true;

    for (const auto& child : *result) {
        const pt::ptree& u = child.second;
        Update update;
        try {
            update.update_id = u.get<int64_t>("update_id", 0);
            if (auto m = u.get_child_optional("message")) {
                update.kind = Update::Kind::Message;
                readMessage(*m, update.message);
            } else if (auto cq = u.get_child_optional("callback_query")) {
                update.kind = Update::Kind::Callback;
                update.callback.id = cq->get<std::string>("id", "");
                update.callback.from_id = cq->get<int64_t>("from.id", 0);
                update.callback.from_username = cq->get<std::string>("from.username", "");
                update.callback.chat_id = cq->get<int64_t>("message.chat.id", update.callback.from_id);
                update.callback.data = cq->get<std::string>("data", "");
            } else if (auto mcm = u.get_child_optional("my_chat_member")) {
                update.kind = Update::Kind::MemberStatus;
                update.member.chat_id = mcm->get<int64_t>("chat.id", 0);
                update.member.chat_type = mcm->get<std::string>("chat.type", "");
                update.member.title = mcm->get<std::string>("chat.title", "");
                if (update.member.title.empty()) {
                    update.member.title = mcm->get<std::string>("chat.username", "");
                }
                update.member.status = mcm->get<std::string>("new_chat_member.status", "");
            }
        } catch (const pt::ptree_error& e) {
            Logger::getInstance().warning("Skipping malformed update " + std::to_string(update.update_id) +
                                          ": " + e.what());
            update.kind = Update::Kind::Other;
        }
        out.push_back(update);
    }
    return true;
}

} // namespace postsched

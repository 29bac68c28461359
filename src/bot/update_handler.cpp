#include "../../include/bot/update_handler.hpp"
#include "../../include/utils/logger.hpp"

#include <vector>

namespace postsched {

UpdateHandler::UpdateHandler(PlatformClient& client, CommandRouter& router, ChannelRegistry& channels)
    : client_(client), router_(router), channels_(channels) {
}

void UpdateHandler::send(int64_t chat_id, const Reply& reply) {
    if (reply.text.empty()) return;
    if (!client_.sendText(chat_id, reply.text, reply.reply_markup, reply.parse_mode)) {
        Logger::getInstance().debug("Reply to " + std::to_string(chat_id) + " not delivered");
    }
}

void UpdateHandler::handle(const Update& update) {
    switch (update.kind) {
        case Update::Kind::Message: {
            const IncomingMessage& m = update.message;
            if (m.from_id == 0) return;
            // Replies go to the user directly, as the commands are private.
            send(m.from_id, router_.handleMessage(m));
            break;
        }
        case Update::Kind::Callback: {
            const CallbackQuery& q = update.callback;
            const Reply reply = router_.handleCallback(q);
            if (!client_.answerCallback(q.id)) {
                Logger::getInstance().debug("Callback " + q.id + " not acknowledged");
            }
            send(q.chat_id != 0 ? q.chat_id : q.from_id, reply);
            break;
        }
        case Update::Kind::MemberStatus: {
            const MemberStatusChange& mc = update.member;
            if (mc.chat_type == "private") return;
            const Error err = channels_.handleMemberStatus(mc.chat_id, mc.title, mc.status);
            if (err != Error::None) {
                Logger::getInstance().error("Failed to record channel " + std::to_string(mc.chat_id) + ": " +
                                            errorToString(err));
            }
            break;
        }
        case Update::Kind::Other:
            Logger::getInstance().debug("Ignoring update " + std::to_string(update.update_id));
            break;
    }
}

bool UpdateHandler::pollOnce(int timeout_seconds) {
    std::vector<Update> updates;
    if (!client_.getUpdates(offset_, timeout_seconds, updates)) return false;

    for (const auto& update : updates) {
        // Advance first so a handler failure cannot replay the update forever.
        if (update.update_id >= offset_) offset_ = update.update_id + 1;
        try {
            handle(update);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Update " + std::to_string(update.update_id) + " failed: " + e.what());
        }
    }
    return true;
}

} // namespace postsched

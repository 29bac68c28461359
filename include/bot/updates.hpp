#ifndef POSTSCHED_UPDATES_HPP
#define POSTSCHED_UPDATES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace postsched {

struct IncomingMessage {
    int64_t chat_id = 0;
    int64_t message_id = 0;
    int64_t from_id = 0;
    std::string from_username;
    std::string text;  // text or caption
    std::string photo_file_id;  // largest size of an attached photo
    bool forwarded = false;
    // Original chat/message of a message forwarded from a channel, 0 otherwise.
    int64_t origin_chat_id = 0;
    int64_t origin_message_id = 0;
};

struct CallbackQuery {
    std::string id;
    int64_t from_id = 0;
    std::string from_username;
    int64_t chat_id = 0;
    std::string data;
};

// my_chat_member: the bot's own membership changed in a chat.
struct MemberStatusChange {
    int64_t chat_id = 0;
    std::string chat_type;
    std::string title;
    std::string status;
};

struct Update {
    enum class Kind {
        Message,
        Callback,
        MemberStatus,
        Other
    };

    int64_t update_id = 0;
    Kind kind = Kind::Other;
    IncomingMessage message;
    CallbackQuery callback;
    MemberStatusChange member;
};

// Parses a getUpdates response body ({"ok":true,"result":[...]}).
bool parseUpdates(const std::string& body, std::vector<Update>& out, std::string& error);

} // namespace postsched

#endif // POSTSCHED_UPDATES_HPP

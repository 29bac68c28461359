#include "../../include/platform/error_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace postsched {

namespace {

// Descriptions Telegram returns when the source or destination chat/message
// cannot be reached by the bot.
const char* const kNotMemberMarkers[] = {
    "chat not found",
    "message to forward not found",
    "message to copy not found",
    "bot is not a member",
    "have no rights",
    "chat_forwards_restricted",
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

DeliveryError classifyTelegramError(long http_status, const std::string& description) {
    if (http_status == 429) return DeliveryError::RateLimited;
    if (http_status == 0 || http_status >= 500) return DeliveryError::Transient;

    if (http_status == 400 || http_status == 403) {
        const std::string lower = toLower(description);
        for (const char* marker : kNotMemberMarkers) {
            if (lower.find(marker) != std::string::npos) return DeliveryError::NotMember;
        }
    }
    return DeliveryError::Other;
}

DeliveryError classifyVkError(int error_code) {
    switch (error_code) {
        case 6:   // too many requests per second
        case 9:   // flood control
        case 29:  // rate limit reached
            return DeliveryError::RateLimited;
        case 1:   // unknown error
        case 10:  // internal server error
            return DeliveryError::Transient;
        case 7:   // permission denied
        case 15:  // access denied
        case 27:  // group authorization failed
        case 203: // access to group denied
        case 214: // access to adding post denied
            return DeliveryError::NotMember;
        default:
            return DeliveryError::Other;
    }
}

} // namespace postsched

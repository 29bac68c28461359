#ifndef POSTSCHED_PLATFORM_CLIENT_HPP
#define POSTSCHED_PLATFORM_CLIENT_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "../scheduler/models.hpp"
#include "../bot/updates.hpp"

namespace postsched {

struct DeliveryResult {
    DeliveryError error = DeliveryError::None;
    std::string message_ref;  // platform id of the created message/post
    std::string detail;       // platform error text on failure

    bool ok() const { return error == DeliveryError::None; }

    static DeliveryResult success(const std::string& ref) {
        DeliveryResult r;
        r.message_ref = ref;
        return r;
    }
    static DeliveryResult failure(DeliveryError error, const std::string& detail) {
        DeliveryResult r;
        r.error = error;
        r.detail = detail;
        return r;
    }
};

// Everything the scheduler and the bot front end need from Telegram and VK.
// Delivery calls never throw; failures are classified into DeliveryError.
class PlatformClient {
public:
    virtual ~PlatformClient() = default;

    // Forward with attribution (Telegram).
    virtual DeliveryResult forward(const SourceRef& source, const ChannelTarget& target) = 0;
    // Re-send without attribution (Telegram).
    virtual DeliveryResult copy(const SourceRef& source, const ChannelTarget& target) = 0;
    // Wall post (VK): the caption as text, the photo as an attachment.
    virtual DeliveryResult postToWall(const SourceRef& source, const ChannelTarget& target) = 0;

    virtual bool sendText(int64_t chat_id, const std::string& text,
                          const std::string& reply_markup_json = "",
                          const std::string& parse_mode = "") = 0;
    virtual bool answerCallback(const std::string& callback_id, const std::string& text = "") = 0;
    virtual bool getUpdates(int64_t offset, int timeout_seconds, std::vector<Update>& out) = 0;

    // Groups the VK token can post to. False with `error` set when VK is
    // unavailable or not configured.
    virtual bool listVkGroups(std::vector<ChannelTarget>& out, std::string& error) = 0;
};

} // namespace postsched

#endif // POSTSCHED_PLATFORM_CLIENT_HPP

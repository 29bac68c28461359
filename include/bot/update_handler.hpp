#ifndef POSTSCHED_UPDATE_HANDLER_HPP
#define POSTSCHED_UPDATE_HANDLER_HPP

#include <atomic>
#include <cstdint>
#include "updates.hpp"
#include "command_router.hpp"
#include "../channels/channel_registry.hpp"
#include "../platform/platform_client.hpp"

namespace postsched {

// Telegram long-polling front end: fetches updates and routes them to the
// command router (messages, button presses) or the channel registry
// (membership changes).
class UpdateHandler {
public:
    UpdateHandler(PlatformClient& client, CommandRouter& router, ChannelRegistry& channels);

    void handle(const Update& update);

    // One getUpdates round. False when the request failed.
    bool pollOnce(int timeout_seconds);

    int64_t offset() const { return offset_; }

private:
    void send(int64_t chat_id, const Reply& reply);

    PlatformClient& client_;
    CommandRouter& router_;
    ChannelRegistry& channels_;
    std::atomic<int64_t> offset_{0};
};

} // namespace postsched

#endif // POSTSCHED_UPDATE_HANDLER_HPP

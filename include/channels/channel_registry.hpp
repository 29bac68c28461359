#ifndef POSTSCHED_CHANNEL_REGISTRY_HPP
#define POSTSCHED_CHANNEL_REGISTRY_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "../storage/stores.hpp"
#include "../platform/platform_client.hpp"

namespace postsched {

// Destination targets: Telegram channels where the bot is an admin, and VK
// communities the configured token can post to.
class ChannelRegistry {
public:
    ChannelRegistry(ChannelStore& store, PlatformClient& client);

    Error upsertFromEvent(const ChannelTarget& target);

    // my_chat_member handling: administrator/creator upserts a Telegram target.
    // Any other status leaves the registry untouched.
    Error handleMemberStatus(int64_t chat_id, const std::string& title, const std::string& status);

    // VK: re-queries the platform and replaces the stored VK set; nothing is
    // replaced when the client fails. Telegram has no way to enumerate a
    // bot's channels, so the stored set is returned.
    bool refresh(Platform platform, std::vector<ChannelTarget>& out, std::string& error);

    Error list(Platform platform, std::vector<ChannelTarget>& out);
    Error find(Platform platform, int64_t external_id, ChannelTarget& out);
    Error remove(Platform platform, int64_t external_id);

private:
    ChannelStore& store_;
    PlatformClient& client_;
};

} // namespace postsched

#endif // POSTSCHED_CHANNEL_REGISTRY_HPP

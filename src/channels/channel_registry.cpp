#include "../../include/channels/channel_registry.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

ChannelRegistry::ChannelRegistry(ChannelStore& store, PlatformClient& client)
    : store_(store), client_(client) {
}

Error ChannelRegistry::upsertFromEvent(const ChannelTarget& target) {
    const Error err = store_.upsertChannel(target);
    if (err == Error::None) {
        Logger::getInstance().info(std::string("Channel ") + platformToString(target.platform) + ":" +
                                   std::to_string(target.external_id) + " (" + target.title + ") registered");
    }
    return err;
}

Error ChannelRegistry::handleMemberStatus(int64_t chat_id, const std::string& title, const std::string& status) {
    if (status != "administrator" && status != "creator") {
        Logger::getInstance().info("Bot status in chat " + std::to_string(chat_id) + " is now '" + status +
                                   "', channel left in registry");
        return Error::None;
    }

    ChannelTarget target;
    target.platform = Platform::Telegram;
    target.external_id = chat_id;
    target.title = title;
    target.can_post = true;
    return upsertFromEvent(target);
}

bool ChannelRegistry::refresh(Platform platform, std::vector<ChannelTarget>& out, std::string& error) {
    if (platform == Platform::Telegram) {
        const Error err = store_.listChannels(Platform::Telegram, out);
        if (err != Error::None) {
            error = errorToString(err);
            return false;
        }
        return true;
    }

    std::vector<ChannelTarget> groups;
    if (!client_.listVkGroups(groups, error)) {
        Logger::getInstance().warning("VK group refresh failed: " + error);
        return false;
    }

    const Error err = store_.replaceChannels(Platform::Vk, groups);
    if (err != Error::None) {
        error = errorToString(err);
        return false;
    }
    Logger::getInstance().info("VK groups refreshed: " + std::to_string(groups.size()) + " found");
    if (store_.listChannels(Platform::Vk, out) != Error::None) {
        error = errorToString(Error::StorageUnavailable);
        return false;
    }
    return true;
}

Error ChannelRegistry::list(Platform platform, std::vector<ChannelTarget>& out) {
    return store_.listChannels(platform, out);
}

Error ChannelRegistry::find(Platform platform, int64_t external_id, ChannelTarget& out) {
    return store_.findChannel(platform, external_id, out);
}

Error ChannelRegistry::remove(Platform platform, int64_t external_id) {
    const Error err = store_.deleteChannel(platform, external_id);
    if (err == Error::None) {
        Logger::getInstance().info(std::string("Channel ") + platformToString(platform) + ":" +
                                   std::to_string(external_id) + " removed");
    }
    return err;
}

} // namespace postsched

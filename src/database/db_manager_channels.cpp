#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

namespace {

ChannelTarget readChannel(const PGresult* res, int row) {
    ChannelTarget t;
    platformFromString(DatabaseConnection::getString(res, row, 0), t.platform);
    t.external_id = DatabaseConnection::getInt64(res, row, 1);
    t.title = DatabaseConnection::getString(res, row, 2);
    t.can_post = DatabaseConnection::getString(res, row, 3) == "t";
    return t;
}

} // namespace

Error DatabaseManager::upsertChannel(const ChannelTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(target.external_id);
    const char* params[4] = {
        platformToString(target.platform),
        id.c_str(),
        target.title.c_str(),
        target.can_post ? "true" : "false"
    };
    return execCommand("upsert_channel", 4, params);
}

Error DatabaseManager::replaceChannels(Platform platform, const std::vector<ChannelTarget>& targets) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_->begin()) return Error::StorageUnavailable;

    const char* del_params[1] = {platformToString(platform)};
    if (execCommand("delete_channels_by_platform", 1, del_params) != Error::None) {
        db_->rollback();
        return Error::StorageUnavailable;
    }

    for (const auto& t : targets) {
        const std::string id = std::to_string(t.external_id);
        const char* params[4] = {
            platformToString(platform),
            id.c_str(),
            t.title.c_str(),
            t.can_post ? "true" : "false"
        };
        if (execCommand("upsert_channel", 4, params) != Error::None) {
            db_->rollback();
            return Error::StorageUnavailable;
        }
    }

    if (!db_->commit()) return Error::StorageUnavailable;
    Logger::getInstance().info(std::string("Replaced ") + platformToString(platform) + " channels: " +
                               std::to_string(targets.size()) + " entries");
    return Error::None;
}

Error DatabaseManager::findChannel(Platform platform, int64_t external_id, ChannelTarget& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(external_id);
    const char* params[2] = {platformToString(platform), id.c_str()};
    PGresult* res = db_->executePrepared("find_channel", 2, params);
    if (!res) return Error::StorageUnavailable;
    if (PQntuples(res) == 0) {
        PQclear(res);
        return Error::NotFound;
    }
    out = readChannel(res, 0);
    PQclear(res);
    return Error::None;
}

Error DatabaseManager::listChannels(Platform platform, std::vector<ChannelTarget>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    const char* params[1] = {platformToString(platform)};
    PGresult* res = db_->executePrepared("list_channels", 1, params);
    if (!res) return Error::StorageUnavailable;
    const int rows = PQntuples(res);
    out.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; i++) {
        out.push_back(readChannel(res, i));
    }
    PQclear(res);
    return Error::None;
}

Error DatabaseManager::deleteChannel(Platform platform, int64_t external_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(external_id);
    const char* params[2] = {platformToString(platform), id.c_str()};
    PGresult* res = db_->executePrepared("delete_channel", 2, params);
    if (!res) return Error::StorageUnavailable;
    const bool deleted = PQntuples(res) > 0;
    PQclear(res);
    return deleted ? Error::None : Error::NotFound;
}

} // namespace postsched

// User records: registration, approval state, timezone offset

#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

#include <libpq-fe.h>

namespace postsched {

namespace {

UserRecord readUser(const PGresult* res, int row) {
    UserRecord u;
    u.user_id = DatabaseConnection::getInt64(res, row, 0);
    u.username = DatabaseConnection::getString(res, row, 1);
    if (!userStateFromString(DatabaseConnection::getString(res, row, 2), u.state)) {
        Logger::getInstance().warning("Unknown user state for " + std::to_string(u.user_id) + ", treating as pending");
        u.state = UserState::Pending;
    }
    u.tz_offset_minutes = static_cast<int>(DatabaseConnection::getInt64(res, row, 3));
    u.created_at = DatabaseConnection::getInt64(res, row, 4);
    return u;
}

} // namespace

Error DatabaseManager::findUser(int64_t user_id, UserRecord& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(user_id);
    const char* params[1] = {id.c_str()};
    PGresult* res = db_->executePrepared("find_user", 1, params);
    if (!res) return Error::StorageUnavailable;
    if (PQntuples(res) == 0) {
        PQclear(res);
        return Error::NotFound;
    }
    out = readUser(res, 0);
    PQclear(res);
    return Error::None;
}

Error DatabaseManager::insertSuperadmin(const UserRecord& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(user.user_id);
    const std::string tz = std::to_string(user.tz_offset_minutes);
    const std::string created = std::to_string(user.created_at);
    const char* params[4] = {id.c_str(), user.username.c_str(), tz.c_str(), created.c_str()};
    PGresult* res = db_->executePrepared("insert_superadmin", 4, params);
    if (!res) return Error::StorageUnavailable;
    const bool inserted = PQntuples(res) > 0;
    PQclear(res);
    return inserted ? Error::None : Error::StateConflict;
}

Error DatabaseManager::insertPending(const UserRecord& user, int pending_cap) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_->begin()) return Error::StorageUnavailable;

    PGresult* res = db_->executePrepared("lock_registration", 0, nullptr);
    if (!res) {
        db_->rollback();
        return Error::StorageUnavailable;
    }
    PQclear(res);

    const char* count_params[1] = {userStateToString(UserState::Pending)};
    res = db_->executePrepared("count_users_by_state", 1, count_params);
    if (!res || PQntuples(res) == 0) {
        if (res) PQclear(res);
        db_->rollback();
        return Error::StorageUnavailable;
    }
    const int64_t pending = DatabaseConnection::getInt64(res, 0, 0);
    PQclear(res);
    if (pending >= pending_cap) {
        db_->rollback();
        return Error::QueueFull;
    }

    const std::string id = std::to_string(user.user_id);
    const std::string tz = std::to_string(user.tz_offset_minutes);
    const std::string created = std::to_string(user.created_at);
    const char* params[4] = {id.c_str(), user.username.c_str(), tz.c_str(), created.c_str()};
    res = db_->executePrepared("insert_pending_user", 4, params);
    if (!res) {
        db_->rollback();
        return Error::StorageUnavailable;
    }
    const bool inserted = PQntuples(res) > 0;
    PQclear(res);

    if (!db_->commit()) return Error::StorageUnavailable;
    return inserted ? Error::None : Error::StateConflict;
}

Error DatabaseManager::updateUserState(int64_t user_id, UserState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(user_id);
    const char* params[2] = {id.c_str(), userStateToString(state)};
    PGresult* res = db_->executePrepared("update_user_state", 2, params);
    if (!res) return Error::StorageUnavailable;
    const bool updated = PQntuples(res) > 0;
    PQclear(res);
    return updated ? Error::None : Error::NotFound;
}

Error DatabaseManager::updateUserTimezone(int64_t user_id, int offset_minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(user_id);
    const std::string tz = std::to_string(offset_minutes);
    const char* params[2] = {id.c_str(), tz.c_str()};
    PGresult* res = db_->executePrepared("update_user_timezone", 2, params);
    if (!res) return Error::StorageUnavailable;
    const bool updated = PQntuples(res) > 0;
    PQclear(res);
    return updated ? Error::None : Error::NotFound;
}

Error DatabaseManager::deleteUser(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = std::to_string(user_id);
    const char* params[1] = {id.c_str()};
    PGresult* res = db_->executePrepared("delete_user", 1, params);
    if (!res) return Error::StorageUnavailable;
    const bool deleted = PQntuples(res) > 0;
    PQclear(res);
    return deleted ? Error::None : Error::NotFound;
}

Error DatabaseManager::listUsersWith(const char* stmt, int n_params, const char* const* params,
                                     std::vector<UserRecord>& out) {
    out.clear();
    PGresult* res = db_->executePrepared(stmt, n_params, params);
    if (!res) return Error::StorageUnavailable;
    const int rows = PQntuples(res);
    out.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; i++) {
        out.push_back(readUser(res, i));
    }
    PQclear(res);
    return Error::None;
}

Error DatabaseManager::listUsers(std::vector<UserRecord>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listUsersWith("list_users", 0, nullptr, out);
}

Error DatabaseManager::listUsersByState(UserState state, std::vector<UserRecord>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* params[1] = {userStateToString(state)};
    return listUsersWith("list_users_by_state", 1, params, out);
}

} // namespace postsched

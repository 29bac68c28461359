#ifndef POSTSCHED_DB_MANAGER_HPP
#define POSTSCHED_DB_MANAGER_HPP

#include <string>
#include <memory>
#include <mutex>
#include <vector>
#include <cstdint>
#include <optional>
#include "db_connection.hpp"
#include "../storage/stores.hpp"

namespace postsched {

// PostgreSQL backend for users, channels and scheduled posts.
//
// One instance owns one connection. Calls are serialized by an internal mutex,
// but threads that work concurrently (dispatcher, update poller) should each
// use their own instance.
class DatabaseManager : public UserStore, public ChannelStore, public ScheduleStore {
public:
    DatabaseManager(const std::string& host = "localhost",
                   const std::string& port = "5432",
                   const std::string& dbname = "postsched",
                   const std::string& user = "postsched",
                   const std::string& password = "postsched");

    // Connects, creates missing tables and prepares statements.
    bool initialize();

    // Users
    Error findUser(int64_t user_id, UserRecord& out) override;
    Error insertSuperadmin(const UserRecord& user) override;
    Error insertPending(const UserRecord& user, int pending_cap) override;
    Error updateUserState(int64_t user_id, UserState state) override;
    Error updateUserTimezone(int64_t user_id, int offset_minutes) override;
    Error deleteUser(int64_t user_id) override;
    Error listUsers(std::vector<UserRecord>& out) override;
    Error listUsersByState(UserState state, std::vector<UserRecord>& out) override;

    // Channels
    Error upsertChannel(const ChannelTarget& target) override;
    Error replaceChannels(Platform platform, const std::vector<ChannelTarget>& targets) override;
    Error findChannel(Platform platform, int64_t external_id, ChannelTarget& out) override;
    Error listChannels(Platform platform, std::vector<ChannelTarget>& out) override;
    Error deleteChannel(Platform platform, int64_t external_id) override;

    // Scheduled posts
    Error createPost(ScheduledPost& post) override;
    Error getPost(int64_t id, ScheduledPost& out) override;
    Error listDue(UnixTime now, std::vector<ScheduledPost>& out) override;
    Error listScheduled(std::optional<int64_t> owner_id, std::vector<ScheduledPost>& out) override;
    Error listHistory(std::optional<int64_t> owner_id, int limit, std::vector<ScheduledPost>& out) override;
    Error transition(int64_t id, PostState from, PostState to,
                     const std::vector<TargetResult>& results) override;
    Error cancel(int64_t id) override;
    Error reschedule(int64_t id, UnixTime dispatch_at,
                     const std::string& requested_local, int offset_minutes) override;

private:
    bool createSchema();
    bool prepareStatements();

    // Runs a statement expected to produce no rows.
    Error execCommand(const char* stmt, int n_params, const char* const* params);
    Error listUsersWith(const char* stmt, int n_params, const char* const* params, std::vector<UserRecord>& out);
    Error listPostsWith(const char* stmt, int n_params, const char* const* params, std::vector<ScheduledPost>& out);
    Error loadTargets(ScheduledPost& post);
    Error postExistsWithState(int64_t id, PostState& out_state);

    std::unique_ptr<DatabaseConnection> db_;
    std::mutex mutex_;
};

} // namespace postsched

#endif // POSTSCHED_DB_MANAGER_HPP

#ifndef POSTSCHED_IN_MEMORY_STORAGE_HPP
#define POSTSCHED_IN_MEMORY_STORAGE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "stores.hpp"

namespace postsched {

/**
 * In-Memory Storage - replacement for the PostgreSQL backend.
 * Thread-safe: every operation runs under one mutex, which also makes
 * transition() an atomic compare-and-swap.
 * Contents are lost on restart.
 */
class InMemoryStorage : public UserStore, public ChannelStore, public ScheduleStore {
public:
    InMemoryStorage() = default;

    // ========== USERS ==========
    Error findUser(int64_t user_id, UserRecord& out) override;
    Error insertSuperadmin(const UserRecord& user) override;
    Error insertPending(const UserRecord& user, int pending_cap) override;
    Error updateUserState(int64_t user_id, UserState state) override;
    Error updateUserTimezone(int64_t user_id, int offset_minutes) override;
    Error deleteUser(int64_t user_id) override;
    Error listUsers(std::vector<UserRecord>& out) override;
    Error listUsersByState(UserState state, std::vector<UserRecord>& out) override;

    // ========== CHANNELS ==========
    Error upsertChannel(const ChannelTarget& target) override;
    Error replaceChannels(Platform platform, const std::vector<ChannelTarget>& targets) override;
    Error findChannel(Platform platform, int64_t external_id, ChannelTarget& out) override;
    Error listChannels(Platform platform, std::vector<ChannelTarget>& out) override;
    Error deleteChannel(Platform platform, int64_t external_id) override;

    // ========== SCHEDULE ==========
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
    int countByStateLocked(UserState state) const;

    std::mutex mutex_;
    std::map<int64_t, UserRecord> users_;
    std::map<std::pair<int, int64_t>, ChannelTarget> channels_;
    std::map<int64_t, ScheduledPost> posts_;
    int64_t next_post_id_ = 1;
    int64_t user_seq_ = 0;
    std::map<int64_t, int64_t> user_order_;  // user_id -> insertion sequence
};

} // namespace postsched

#endif // POSTSCHED_IN_MEMORY_STORAGE_HPP

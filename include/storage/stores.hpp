#ifndef POSTSCHED_STORES_HPP
#define POSTSCHED_STORES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../scheduler/models.hpp"

namespace postsched {

// Storage seams. Every implementation reports engine failures as
// Error::StorageUnavailable and never throws for them.

class UserStore {
public:
    virtual ~UserStore() = default;

    virtual Error findUser(int64_t user_id, UserRecord& out) = 0;
    // Inserts `user` as the superadmin. StateConflict if one already exists
    // or the id is taken.
    virtual Error insertSuperadmin(const UserRecord& user) = 0;
    // Inserts `user` as pending. QueueFull when `pending_cap` pending records
    // already exist, StateConflict when the id is taken. Check and insert are atomic.
    virtual Error insertPending(const UserRecord& user, int pending_cap) = 0;
    virtual Error updateUserState(int64_t user_id, UserState state) = 0;
    virtual Error updateUserTimezone(int64_t user_id, int offset_minutes) = 0;
    virtual Error deleteUser(int64_t user_id) = 0;
    // Ordered by creation time, then id.
    virtual Error listUsers(std::vector<UserRecord>& out) = 0;
    virtual Error listUsersByState(UserState state, std::vector<UserRecord>& out) = 0;
};

class ChannelStore {
public:
    virtual ~ChannelStore() = default;

    virtual Error upsertChannel(const ChannelTarget& target) = 0;
    // Replaces every target of `platform` with `targets` in one step.
    virtual Error replaceChannels(Platform platform, const std::vector<ChannelTarget>& targets) = 0;
    virtual Error findChannel(Platform platform, int64_t external_id, ChannelTarget& out) = 0;
    // Ordered by title, then external id.
    virtual Error listChannels(Platform platform, std::vector<ChannelTarget>& out) = 0;
    virtual Error deleteChannel(Platform platform, int64_t external_id) = 0;
};

class ScheduleStore {
public:
    virtual ~ScheduleStore() = default;

    // Assigns post.id. The post is stored in state Scheduled.
    virtual Error createPost(ScheduledPost& post) = 0;
    virtual Error getPost(int64_t id, ScheduledPost& out) = 0;
    // Scheduled posts with dispatch_at <= now, oldest instant first.
    virtual Error listDue(UnixTime now, std::vector<ScheduledPost>& out) = 0;
    // Scheduled posts, oldest instant first.
    virtual Error listScheduled(std::optional<int64_t> owner_id, std::vector<ScheduledPost>& out) = 0;
    // Sent, failed and cancelled posts, newest instant first.
    virtual Error listHistory(std::optional<int64_t> owner_id, int limit, std::vector<ScheduledPost>& out) = 0;
    // Compare-and-swap on the stored state. StateConflict when the stored
    // state is not `from`; InvalidState when from -> to is not an edge of the
    // post state machine. Per-target results are written together with the state.
    virtual Error transition(int64_t id, PostState from, PostState to,
                             const std::vector<TargetResult>& results) = 0;
    // Scheduled -> Cancelled, InvalidState from any other state.
    virtual Error cancel(int64_t id) = 0;
    // Moves a Scheduled post to a new instant, InvalidState otherwise.
    virtual Error reschedule(int64_t id, UnixTime dispatch_at,
                             const std::string& requested_local, int offset_minutes) = 0;
};

} // namespace postsched

#endif // POSTSCHED_STORES_HPP

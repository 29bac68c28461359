#ifndef POSTSCHED_SCHEDULE_SERVICE_HPP
#define POSTSCHED_SCHEDULE_SERVICE_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "models.hpp"
#include "../storage/stores.hpp"
#include "../auth/access_control.hpp"
#include "../channels/channel_registry.hpp"

namespace postsched {

struct TargetKey {
    Platform platform = Platform::Telegram;
    int64_t external_id = 0;
};

struct PostRequest {
    int64_t owner_id = 0;
    SourceRef source;
    std::vector<TargetKey> targets;
    std::string local_time;  // "now", "HH:MM" or "DD.MM.YYYY HH:MM"
};

// Validates submissions and edits of scheduled posts on top of the store.
class ScheduleService {
public:
    using Clock = std::function<UnixTime()>;

    ScheduleService(ScheduleStore& store,
                    AccessControl& access,
                    ChannelRegistry& channels,
                    Clock clock = nowUtcClock());

    // Repeated targets in the request collapse into one.
    Error schedulePost(const PostRequest& request, ScheduledPost& out);

    // Owner or superadmin only.
    Error cancel(int64_t actor_id, int64_t post_id);

    // A scheduled post moves in place. A failed or cancelled post is scheduled
    // again as a new record with the same source and targets; `out` is the
    // record that will be dispatched.
    Error reschedule(int64_t actor_id, int64_t post_id, const std::string& local_time, ScheduledPost& out);

    Error listScheduled(int64_t owner_id, std::vector<ScheduledPost>& out);
    Error listHistory(int64_t owner_id, int limit, std::vector<ScheduledPost>& out);
    Error getPost(int64_t post_id, ScheduledPost& out);

    UnixTime now() const { return clock_(); }

private:
    static Clock nowUtcClock();

    Error resolveFor(int64_t owner_id, const std::string& local_time,
                     UnixTime& out_instant, int& out_offset);
    Error checkOwnership(int64_t actor_id, const ScheduledPost& post);

    ScheduleStore& store_;
    AccessControl& access_;
    ChannelRegistry& channels_;
    Clock clock_;
};

} // namespace postsched

#endif // POSTSCHED_SCHEDULE_SERVICE_HPP

#include "../../include/scheduler/schedule_service.hpp"
#include "../../include/scheduler/timezone.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

ScheduleService::Clock ScheduleService::nowUtcClock() {
    return []() { return nowUtc(); };
}

ScheduleService::ScheduleService(ScheduleStore& store,
                                 AccessControl& access,
                                 ChannelRegistry& channels,
                                 Clock clock)
    : store_(store),
      access_(access),
      channels_(channels),
      clock_(std::move(clock)) {
}

Error ScheduleService::resolveFor(int64_t owner_id, const std::string& local_time,
                                  UnixTime& out_instant, int& out_offset) {
    UserRecord owner;
    Error err = access_.getUser(owner_id, owner);
    if (err != Error::None) return err == Error::NotFound ? Error::NotAuthorized : err;

    LocalTime local;
    err = parseLocalTime(local_time, local);
    if (err != Error::None) return err;

    err = resolveDispatchInstant(local, owner.tz_offset_minutes, clock_(), out_instant);
    if (err != Error::None) return err;
    out_offset = owner.tz_offset_minutes;
    return Error::None;
}

Error ScheduleService::schedulePost(const PostRequest& request, ScheduledPost& out) {
    Error err = access_.authorize(request.owner_id);
    if (err != Error::None) return err;

    if (request.targets.empty()) return Error::NotFound;

    std::vector<TargetResult> targets;
    targets.reserve(request.targets.size());
    for (const auto& key : request.targets) {
        // Results are keyed by target, so a repeated target is kept once.
        bool repeated = false;
        for (const auto& t : targets) {
            if (t.target.platform == key.platform && t.target.external_id == key.external_id) {
                repeated = true;
                break;
            }
        }
        if (repeated) continue;

        TargetResult result;
        err = channels_.find(key.platform, key.external_id, result.target);
        if (err != Error::None) return err;
        targets.push_back(result);
    }

    UnixTime instant = 0;
    int offset = 0;
    err = resolveFor(request.owner_id, request.local_time, instant, offset);
    if (err != Error::None) return err;

    ScheduledPost post;
    post.owner_id = request.owner_id;
    post.source = request.source;
    post.targets = std::move(targets);
    post.requested_local = request.local_time;
    post.tz_offset_minutes = offset;
    post.dispatch_at = instant;
    post.created_at = clock_();

    err = store_.createPost(post);
    if (err != Error::None) return err;

    Logger::getInstance().info("Post " + std::to_string(post.id) + " scheduled by " +
                               std::to_string(post.owner_id) + " for " + std::to_string(post.dispatch_at) +
                               " (" + std::to_string(post.targets.size()) + " targets)");
    out = post;
    return Error::None;
}

Error ScheduleService::checkOwnership(int64_t actor_id, const ScheduledPost& post) {
    Error err = access_.authorize(actor_id);
    if (err != Error::None) return err;
    if (post.owner_id == actor_id) return Error::None;
    if (access_.isSuperadmin(actor_id)) return Error::None;
    return Error::NotAuthorized;
}

Error ScheduleService::cancel(int64_t actor_id, int64_t post_id) {
    ScheduledPost post;
    Error err = store_.getPost(post_id, post);
    if (err != Error::None) return err;

    err = checkOwnership(actor_id, post);
    if (err != Error::None) return err;

    err = store_.cancel(post_id);
    if (err == Error::None) {
        Logger::getInstance().info("Post " + std::to_string(post_id) + " cancelled by " + std::to_string(actor_id));
    }
    return err;
}

Error ScheduleService::reschedule(int64_t actor_id, int64_t post_id, const std::string& local_time,
                                  ScheduledPost& out) {
    ScheduledPost post;
    Error err = store_.getPost(post_id, post);
    if (err != Error::None) return err;

    err = checkOwnership(actor_id, post);
    if (err != Error::None) return err;

    if (post.state != PostState::Scheduled &&
        post.state != PostState::Failed &&
        post.state != PostState::Cancelled) {
        return Error::InvalidState;
    }

    UnixTime instant = 0;
    int offset = 0;
    err = resolveFor(post.owner_id, local_time, instant, offset);
    if (err != Error::None) return err;

    if (post.state == PostState::Scheduled) {
        err = store_.reschedule(post_id, instant, local_time, offset);
        if (err != Error::None) return err;
        Logger::getInstance().info("Post " + std::to_string(post_id) + " rescheduled to " + std::to_string(instant));
        return store_.getPost(post_id, out);
    }

    ScheduledPost again;
    again.owner_id = post.owner_id;
    again.source = post.source;
    for (const auto& t : post.targets) {
        TargetResult fresh;
        fresh.target = t.target;
        again.targets.push_back(fresh);
    }
    again.requested_local = local_time;
    again.tz_offset_minutes = offset;
    again.dispatch_at = instant;
    again.created_at = clock_();

    err = store_.createPost(again);
    if (err != Error::None) return err;
    Logger::getInstance().info("Post " + std::to_string(post_id) + " (" + postStateToString(post.state) +
                               ") scheduled again as " + std::to_string(again.id));
    out = again;
    return Error::None;
}

Error ScheduleService::listScheduled(int64_t owner_id, std::vector<ScheduledPost>& out) {
    return store_.listScheduled(owner_id, out);
}

Error ScheduleService::listHistory(int64_t owner_id, int limit, std::vector<ScheduledPost>& out) {
    return store_.listHistory(owner_id, limit, out);
}

Error ScheduleService::getPost(int64_t post_id, ScheduledPost& out) {
    return store_.getPost(post_id, out);
}

} // namespace postsched

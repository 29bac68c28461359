#ifndef POSTSCHED_DISPATCHER_HPP
#define POSTSCHED_DISPATCHER_HPP

#include <functional>
#include <mutex>
#include <vector>
#include "models.hpp"
#include "../storage/stores.hpp"
#include "../platform/platform_client.hpp"

namespace postsched {

struct TickReport {
    int due = 0;
    int claimed = 0;
    int skipped = 0;   // claimed elsewhere between listing and claiming
    int sent = 0;
    int failed = 0;
    bool aborted = false;          // listing failed, nothing was touched
    bool skipped_overlap = false;  // another tick was still running
};

// One pass over the due posts: claim, deliver, record the outcome.
class Dispatcher {
public:
    using Clock = std::function<UnixTime()>;

    Dispatcher(ScheduleStore& store, PlatformClient& client, Clock clock = Clock());

    TickReport runOnce();

    // Delivers one claimed post to every target. Never throws.
    std::vector<TargetResult> deliver(const ScheduledPost& post);

private:
    TargetResult deliverTo(const SourceRef& source, const ChannelTarget& target);
    void finalize(const ScheduledPost& post, const std::vector<TargetResult>& results, TickReport& report);

    ScheduleStore& store_;
    PlatformClient& client_;
    Clock clock_;
    std::mutex tick_mutex_;
};

} // namespace postsched

#endif // POSTSCHED_DISPATCHER_HPP

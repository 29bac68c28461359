#include "../../include/scheduler/dispatcher.hpp"
#include "../../include/scheduler/timezone.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

namespace {

std::string targetLabel(const ChannelTarget& target) {
    return std::string(platformToString(target.platform)) + ":" + std::to_string(target.external_id);
}

} // namespace

Dispatcher::Dispatcher(ScheduleStore& store, PlatformClient& client, Clock clock)
    : store_(store), client_(client), clock_(std::move(clock)) {
    if (!clock_) clock_ = []() { return nowUtc(); };
}

TickReport Dispatcher::runOnce() {
    TickReport report;
    std::unique_lock<std::mutex> guard(tick_mutex_, std::try_to_lock);
    if (!guard.owns_lock()) {
        report.skipped_overlap = true;
        Logger::getInstance().debug("Dispatch tick skipped: previous tick still running");
        return report;
    }

    std::vector<ScheduledPost> due;
    const Error err = store_.listDue(clock_(), due);
    if (err != Error::None) {
        report.aborted = true;
        Logger::getInstance().error(std::string("Dispatch tick aborted: ") + errorToString(err));
        return report;
    }
    report.due = static_cast<int>(due.size());

    for (const auto& post : due) {
        const Error claim = store_.transition(post.id, PostState::Scheduled, PostState::Dispatching, {});
        if (claim == Error::StateConflict || claim == Error::NotFound) {
            report.skipped++;
            Logger::getInstance().debug("Post " + std::to_string(post.id) + " already claimed, skipping");
            continue;
        }
        if (claim != Error::None) {
            report.skipped++;
            Logger::getInstance().error("Claim of post " + std::to_string(post.id) + " failed: " +
                                        errorToString(claim));
            continue;
        }
        report.claimed++;
        Logger::getInstance().info("Post " + std::to_string(post.id) + " claimed for dispatch");

        finalize(post, deliver(post), report);
    }

    if (report.due > 0) {
        Logger::getInstance().info("Dispatch tick: due=" + std::to_string(report.due) +
                                   " claimed=" + std::to_string(report.claimed) +
                                   " sent=" + std::to_string(report.sent) +
                                   " failed=" + std::to_string(report.failed) +
                                   " skipped=" + std::to_string(report.skipped));
    }
    return report;
}

std::vector<TargetResult> Dispatcher::deliver(const ScheduledPost& post) {
    std::vector<TargetResult> results;
    results.reserve(post.targets.size());
    for (const auto& entry : post.targets) {
        TargetResult result;
        try {
            result = deliverTo(post.source, entry.target);
        } catch (const std::exception& e) {
            result.target = entry.target;
            result.outcome = TargetOutcome::Failed;
            result.error = DeliveryError::Other;
            result.error_text = e.what();
        }

        if (result.outcome == TargetOutcome::Sent) {
            Logger::getInstance().info("Post " + std::to_string(post.id) + " delivered to " +
                                       targetLabel(result.target) + " via " +
                                       deliveryMethodToString(result.method) +
                                       (result.message_ref.empty() ? "" : " as " + result.message_ref));
        } else {
            Logger::getInstance().warning("Post " + std::to_string(post.id) + " failed for " +
                                          targetLabel(result.target) + ": " +
                                          deliveryErrorToString(result.error) + " " + result.error_text);
        }
        results.push_back(result);
    }
    return results;
}

TargetResult Dispatcher::deliverTo(const SourceRef& source, const ChannelTarget& target) {
    TargetResult result;
    result.target = target;

    DeliveryResult delivery;
    if (target.platform == Platform::Vk) {
        result.method = DeliveryMethod::Post;
        delivery = client_.postToWall(source, target);
    } else {
        result.method = DeliveryMethod::Forward;
        delivery = client_.forward(source, target);
        // Only an unreachable source is worth a second attempt without attribution.
        if (delivery.error == DeliveryError::NotMember) {
            Logger::getInstance().info("Forward to " + targetLabel(target) + " refused (" + delivery.detail +
                                       "), retrying as copy");
            result.method = DeliveryMethod::Copy;
            delivery = client_.copy(source, target);
        }
    }

    if (delivery.ok()) {
        result.outcome = TargetOutcome::Sent;
        result.message_ref = delivery.message_ref;
    } else {
        result.outcome = TargetOutcome::Failed;
        result.error = delivery.error;
        result.error_text = delivery.detail;
    }
    return result;
}

void Dispatcher::finalize(const ScheduledPost& post, const std::vector<TargetResult>& results,
                          TickReport& report) {
    bool all_sent = !results.empty();
    for (const auto& r : results) {
        if (r.outcome != TargetOutcome::Sent) all_sent = false;
    }
    const PostState final_state = all_sent ? PostState::Sent : PostState::Failed;

    const Error err = store_.transition(post.id, PostState::Dispatching, final_state, results);
    if (err != Error::None) {
        Logger::getInstance().error("Post " + std::to_string(post.id) + " could not be finalized as " +
                                    postStateToString(final_state) + ": " + errorToString(err));
        return;
    }

    if (all_sent) {
        report.sent++;
    } else {
        report.failed++;
    }
    Logger::getInstance().info("Post " + std::to_string(post.id) + " -> " + postStateToString(final_state));
}

} // namespace postsched

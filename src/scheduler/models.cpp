#include "../../include/scheduler/models.hpp"

namespace postsched {

const char* errorToString(Error error) {
    switch (error) {
        case Error::None: return "ok";
        case Error::NotAuthorized: return "not authorized";
        case Error::AlreadyRejected: return "access denied by administrator";
        case Error::QueueFull: return "registration queue is full";
        case Error::InvalidOffset: return "invalid timezone offset";
        case Error::InvalidTime: return "invalid time format";
        case Error::TimeInPast: return "time must be in future";
        case Error::InvalidState: return "invalid state";
        case Error::NotFound: return "not found";
        case Error::StateConflict: return "state conflict";
        case Error::StorageUnavailable: return "storage unavailable";
    }
    return "unknown";
}

const char* userStateToString(UserState state) {
    switch (state) {
        case UserState::Pending: return "pending";
        case UserState::Approved: return "approved";
        case UserState::Rejected: return "rejected";
        case UserState::Superadmin: return "superadmin";
    }
    return "pending";
}

bool userStateFromString(const std::string& text, UserState& out) {
    if (text == "pending") { out = UserState::Pending; return true; }
    if (text == "approved") { out = UserState::Approved; return true; }
    if (text == "rejected") { out = UserState::Rejected; return true; }
    if (text == "superadmin") { out = UserState::Superadmin; return true; }
    return false;
}

const char* platformToString(Platform platform) {
    return platform == Platform::Vk ? "vk" : "tg";
}

bool platformFromString(const std::string& text, Platform& out) {
    if (text == "tg" || text == "telegram") { out = Platform::Telegram; return true; }
    if (text == "vk") { out = Platform::Vk; return true; }
    return false;
}

const char* postStateToString(PostState state) {
    switch (state) {
        case PostState::Scheduled: return "scheduled";
        case PostState::Dispatching: return "dispatching";
        case PostState::Sent: return "sent";
        case PostState::Failed: return "failed";
        case PostState::Cancelled: return "cancelled";
    }
    return "scheduled";
}

bool postStateFromString(const std::string& text, PostState& out) {
    if (text == "scheduled") { out = PostState::Scheduled; return true; }
    if (text == "dispatching") { out = PostState::Dispatching; return true; }
    if (text == "sent") { out = PostState::Sent; return true; }
    if (text == "failed") { out = PostState::Failed; return true; }
    if (text == "cancelled") { out = PostState::Cancelled; return true; }
    return false;
}

bool isTerminal(PostState state) {
    return state == PostState::Sent || state == PostState::Failed || state == PostState::Cancelled;
}

bool isAllowedTransition(PostState from, PostState to) {
    switch (from) {
        case PostState::Scheduled:
            return to == PostState::Dispatching || to == PostState::Cancelled;
        case PostState::Dispatching:
            return to == PostState::Sent || to == PostState::Failed;
        case PostState::Sent:
        case PostState::Failed:
        case PostState::Cancelled:
            return false;
    }
    return false;
}

const char* deliveryErrorToString(DeliveryError error) {
    switch (error) {
        case DeliveryError::None: return "none";
        case DeliveryError::NotMember: return "not_member";
        case DeliveryError::RateLimited: return "rate_limited";
        case DeliveryError::Transient: return "transient";
        case DeliveryError::Other: return "other";
    }
    return "other";
}

bool deliveryErrorFromString(const std::string& text, DeliveryError& out) {
    if (text == "none") { out = DeliveryError::None; return true; }
    if (text == "not_member") { out = DeliveryError::NotMember; return true; }
    if (text == "rate_limited") { out = DeliveryError::RateLimited; return true; }
    if (text == "transient") { out = DeliveryError::Transient; return true; }
    if (text == "other") { out = DeliveryError::Other; return true; }
    return false;
}

const char* deliveryMethodToString(DeliveryMethod method) {
    switch (method) {
        case DeliveryMethod::None: return "none";
        case DeliveryMethod::Forward: return "forward";
        case DeliveryMethod::Copy: return "copy";
        case DeliveryMethod::Post: return "post";
    }
    return "none";
}

bool deliveryMethodFromString(const std::string& text, DeliveryMethod& out) {
    if (text == "none") { out = DeliveryMethod::None; return true; }
    if (text == "forward") { out = DeliveryMethod::Forward; return true; }
    if (text == "copy") { out = DeliveryMethod::Copy; return true; }
    if (text == "post") { out = DeliveryMethod::Post; return true; }
    return false;
}

const char* targetOutcomeToString(TargetOutcome outcome) {
    switch (outcome) {
        case TargetOutcome::Pending: return "pending";
        case TargetOutcome::Sent: return "sent";
        case TargetOutcome::Failed: return "failed";
    }
    return "pending";
}

bool targetOutcomeFromString(const std::string& text, TargetOutcome& out) {
    if (text == "pending") { out = TargetOutcome::Pending; return true; }
    if (text == "sent") { out = TargetOutcome::Sent; return true; }
    if (text == "failed") { out = TargetOutcome::Failed; return true; }
    return false;
}

} // namespace postsched

#ifndef POSTSCHED_MODELS_HPP
#define POSTSCHED_MODELS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace postsched {

// Seconds since the unix epoch, always UTC.
using UnixTime = int64_t;

enum class Error {
    None,
    // authorization
    NotAuthorized,
    AlreadyRejected,
    QueueFull,
    // validation
    InvalidOffset,
    InvalidTime,
    TimeInPast,
    InvalidState,
    NotFound,
    // concurrency
    StateConflict,
    // repository
    StorageUnavailable
};

const char* errorToString(Error error);

enum class UserState {
    Pending,
    Approved,
    Rejected,
    Superadmin
};

const char* userStateToString(UserState state);
bool userStateFromString(const std::string& text, UserState& out);

struct UserRecord {
    int64_t user_id = 0;
    std::string username;
    UserState state = UserState::Pending;
    int tz_offset_minutes = 0;
    UnixTime created_at = 0;
};

enum class Platform {
    Telegram,
    Vk
};

const char* platformToString(Platform platform);
bool platformFromString(const std::string& text, Platform& out);

struct ChannelTarget {
    Platform platform = Platform::Telegram;
    int64_t external_id = 0;
    std::string title;
    bool can_post = true;
};

enum class PostState {
    Scheduled,
    Dispatching,
    Sent,
    Failed,
    Cancelled
};

const char* postStateToString(PostState state);
bool postStateFromString(const std::string& text, PostState& out);
bool isTerminal(PostState state);
// Edges of the post state machine. Nothing leaves a terminal state.
bool isAllowedTransition(PostState from, PostState to);

enum class DeliveryError {
    None,
    NotMember,
    RateLimited,
    Transient,
    Other
};

const char* deliveryErrorToString(DeliveryError error);
bool deliveryErrorFromString(const std::string& text, DeliveryError& out);

enum class DeliveryMethod {
    None,
    Forward,
    Copy,
    Post
};

const char* deliveryMethodToString(DeliveryMethod method);
bool deliveryMethodFromString(const std::string& text, DeliveryMethod& out);

enum class TargetOutcome {
    Pending,
    Sent,
    Failed
};

const char* targetOutcomeToString(TargetOutcome outcome);
bool targetOutcomeFromString(const std::string& text, TargetOutcome& out);

struct SourceRef {
    int64_t chat_id = 0;
    int64_t message_id = 0;
    std::string caption;  // text/caption of the source, used for VK wall posts
    std::string photo_file_id;  // largest photo size, empty for non-photo messages
};

struct TargetResult {
    ChannelTarget target;
    TargetOutcome outcome = TargetOutcome::Pending;
    DeliveryMethod method = DeliveryMethod::None;
    std::string message_ref;
    DeliveryError error = DeliveryError::None;
    std::string error_text;
};

struct ScheduledPost {
    int64_t id = 0;
    int64_t owner_id = 0;
    SourceRef source;
    std::vector<TargetResult> targets;
    std::string requested_local;  // as typed by the user, "now" for immediate
    int tz_offset_minutes = 0;
    UnixTime dispatch_at = 0;
    PostState state = PostState::Scheduled;
    UnixTime created_at = 0;
    UnixTime updated_at = 0;
};

} // namespace postsched

#endif // POSTSCHED_MODELS_HPP

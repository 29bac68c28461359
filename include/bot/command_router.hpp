#ifndef POSTSCHED_COMMAND_ROUTER_HPP
#define POSTSCHED_COMMAND_ROUTER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "updates.hpp"
#include "../auth/access_control.hpp"
#include "../channels/channel_registry.hpp"
#include "../scheduler/schedule_service.hpp"

namespace postsched {

enum class CommandKind {
    Start,
    Help,
    Pending,
    Approve,
    Reject,
    RemoveUser,
    ListUsers,
    Channels,
    RemoveChannel,
    RefreshVkGroups,
    Timezone,
    Scheduled,
    History,
    Cancel,
    Reschedule,
    Post,
    ForwardedMessage,
    ChooseService,
    ChooseTarget,
    DraftTime,
    SendNow,
    Unknown
};

struct Command {
    CommandKind kind = CommandKind::Unknown;
    std::vector<std::string> args;
};

// "/approve 42", "/post@my_bot tg:-100 now". Plain text is Unknown.
Command parseCommandText(const std::string& text);
// Inline button payloads: "approve:<id>", "reject:<id>", "cancel:<id>",
// "svc:tg|vk", "tgch:<id>", "vkgrp:<id>", "sendnow".
Command parseCallbackData(const std::string& data);

// "tg:-100,vk:123" -> target keys. False on any malformed token.
bool parseTargetList(const std::string& text, std::vector<TargetKey>& out);

struct Reply {
    std::string text;
    std::string reply_markup;  // JSON, empty for none
    std::string parse_mode;
};

struct CommandContext {
    int64_t user_id = 0;
    std::string username;
    IncomingMessage message;  // the triggering message, empty for callbacks
};

// The last forwarded message of a user and the button choices made for it.
struct Draft {
    SourceRef source;
    bool has_target = false;
    TargetKey target;
    bool awaiting_time = false;  // next plain text is the dispatch time
};

// Maps bot commands onto access control, the channel registry and the
// schedule service. Drafts live here.
class CommandRouter {
public:
    CommandRouter(AccessControl& access,
                  ChannelRegistry& channels,
                  ScheduleService& schedule,
                  bool vk_enabled,
                  std::function<void()> on_due_now = std::function<void()>());

    Reply handle(const Command& command, const CommandContext& context);
    Reply handleMessage(const IncomingMessage& message);
    Reply handleCallback(const CallbackQuery& query);

    bool draftFor(int64_t user_id, SourceRef& out);
    bool draftFor(int64_t user_id, Draft& out);

    static std::string errorMessage(Error error);

private:
    using Handler = Reply (CommandRouter::*)(const Command&, const CommandContext&);

    struct Route {
        Handler handler;
        bool authorized_only;
    };

    Reply onStart(const Command& command, const CommandContext& context);
    Reply onHelp(const Command& command, const CommandContext& context);
    Reply onPending(const Command& command, const CommandContext& context);
    Reply onApprove(const Command& command, const CommandContext& context);
    Reply onReject(const Command& command, const CommandContext& context);
    Reply onRemoveUser(const Command& command, const CommandContext& context);
    Reply onListUsers(const Command& command, const CommandContext& context);
    Reply onChannels(const Command& command, const CommandContext& context);
    Reply onRemoveChannel(const Command& command, const CommandContext& context);
    Reply onRefreshVkGroups(const Command& command, const CommandContext& context);
    Reply onTimezone(const Command& command, const CommandContext& context);
    Reply onScheduled(const Command& command, const CommandContext& context);
    Reply onHistory(const Command& command, const CommandContext& context);
    Reply onCancel(const Command& command, const CommandContext& context);
    Reply onReschedule(const Command& command, const CommandContext& context);
    Reply onPost(const Command& command, const CommandContext& context);
    Reply onForwarded(const Command& command, const CommandContext& context);
    Reply onChooseService(const Command& command, const CommandContext& context);
    Reply onChooseTarget(const Command& command, const CommandContext& context);
    Reply onDraftTime(const Command& command, const CommandContext& context);
    Reply onSendNow(const Command& command, const CommandContext& context);

    Reply scheduleDraftTarget(int64_t user_id, const std::string& local_time);
    Reply submit(const PostRequest& request);
    bool awaitingTime(int64_t user_id);
    int userOffset(int64_t user_id);
    std::string describePost(const ScheduledPost& post, int offset_minutes, bool with_results);
    void notifyIfDue(const ScheduledPost& post);

    AccessControl& access_;
    ChannelRegistry& channels_;
    ScheduleService& schedule_;
    bool vk_enabled_;
    std::function<void()> on_due_now_;

    std::map<CommandKind, Route> routes_;

    std::mutex drafts_mutex_;
    std::map<int64_t, Draft> drafts_;
};

} // namespace postsched

#endif // POSTSCHED_COMMAND_ROUTER_HPP

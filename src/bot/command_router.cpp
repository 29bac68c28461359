#include "../../include/bot/command_router.hpp"
#include "../../include/scheduler/timezone.hpp"
#include "../../include/utils/json_util.hpp"
#include "../../include/utils/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace postsched {

namespace {

constexpr int kHistoryLimit = 10;

const std::map<std::string, CommandKind>& commandTable() {
    static const std::map<std::string, CommandKind> table = {
        {"/start", CommandKind::Start},
        {"/help", CommandKind::Help},
        {"/pending", CommandKind::Pending},
        {"/approve", CommandKind::Approve},
        {"/reject", CommandKind::Reject},
        {"/remove_user", CommandKind::RemoveUser},
        {"/list_users", CommandKind::ListUsers},
        {"/channels", CommandKind::Channels},
        {"/remove_channel", CommandKind::RemoveChannel},
        {"/refresh_vkgroups", CommandKind::RefreshVkGroups},
        {"/tz", CommandKind::Timezone},
        {"/scheduled", CommandKind::Scheduled},
        {"/history", CommandKind::History},
        {"/cancel", CommandKind::Cancel},
        {"/reschedule", CommandKind::Reschedule},
        {"/post", CommandKind::Post},
    };
    return table;
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

std::string joinFrom(const std::vector<std::string>& words, size_t first) {
    std::string out;
    for (size_t i = first; i < words.size(); i++) {
        if (!out.empty()) out += " ";
        out += words[i];
    }
    return out;
}

bool parseId(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(value);
    return true;
}

// Legacy Markdown: only these characters need escaping.
std::string escapeMarkdown(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c == '_' || c == '*' || c == '`' || c == '[') out += '\\';
        out += c;
    }
    return out;
}

std::string userLink(const UserRecord& user) {
    const std::string name = user.username.empty() ? std::to_string(user.user_id) : user.username;
    return "[" + escapeMarkdown(name) + "](tg://user?id=" + std::to_string(user.user_id) + ")";
}

std::string targetTitle(const ChannelTarget& target) {
    const std::string name = target.title.empty() ? std::to_string(target.external_id) : target.title;
    return target.platform == Platform::Vk ? "VK: " + name : name;
}

Reply text(const std::string& body) {
    Reply reply;
    reply.text = body;
    return reply;
}

} // namespace

Command parseCommandText(const std::string& text) {
    Command command;
    const std::vector<std::string> words = splitWords(text);
    if (words.empty() || words[0][0] != '/') return command;

    std::string name = words[0];
    const size_t at = name.find('@');
    if (at != std::string::npos) name = name.substr(0, at);

    auto it = commandTable().find(name);
    if (it == commandTable().end()) return command;
    command.kind = it->second;
    command.args.assign(words.begin() + 1, words.end());
    return command;
}

Command parseCallbackData(const std::string& data) {
    Command command;
    if (data == "sendnow") {
        command.kind = CommandKind::SendNow;
        return command;
    }
    const size_t colon = data.find(':');
    if (colon == std::string::npos) return command;

    const std::string action = data.substr(0, colon);
    const std::string arg = data.substr(colon + 1);
    if (action == "approve") {
        command.kind = CommandKind::Approve;
    } else if (action == "reject") {
        command.kind = CommandKind::Reject;
    } else if (action == "cancel") {
        command.kind = CommandKind::Cancel;
    } else if (action == "svc") {
        command.kind = CommandKind::ChooseService;
    } else if (action == "tgch" || action == "vkgrp") {
        // Carried on as a target list token, "tg:<id>" or "vk:<id>".
        command.kind = CommandKind::ChooseTarget;
        command.args.push_back((action == "tgch" ? "tg:" : "vk:") + arg);
        return command;
    } else {
        return command;
    }
    command.args.push_back(arg);
    return command;
}

bool parseTargetList(const std::string& text, std::vector<TargetKey>& out) {
    out.clear();
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, ',')) {
        if (token.empty()) continue;
        const size_t colon = token.find(':');
        if (colon == std::string::npos) return false;
        TargetKey key;
        if (!platformFromString(token.substr(0, colon), key.platform)) return false;
        if (!parseId(token.substr(colon + 1), key.external_id)) return false;
        out.push_back(key);
    }
    return !out.empty();
}

CommandRouter::CommandRouter(AccessControl& access,
                             ChannelRegistry& channels,
                             ScheduleService& schedule,
                             bool vk_enabled,
                             std::function<void()> on_due_now)
    : access_(access),
      channels_(channels),
      schedule_(schedule),
      vk_enabled_(vk_enabled),
      on_due_now_(std::move(on_due_now)) {
    routes_[CommandKind::Start] = {&CommandRouter::onStart, false};
    routes_[CommandKind::Help] = {&CommandRouter::onHelp, false};
    routes_[CommandKind::Pending] = {&CommandRouter::onPending, true};
    // approve/reject/remove check the actor themselves.
    routes_[CommandKind::Approve] = {&CommandRouter::onApprove, false};
    routes_[CommandKind::Reject] = {&CommandRouter::onReject, false};
    routes_[CommandKind::RemoveUser] = {&CommandRouter::onRemoveUser, false};
    routes_[CommandKind::ListUsers] = {&CommandRouter::onListUsers, true};
    routes_[CommandKind::Channels] = {&CommandRouter::onChannels, true};
    routes_[CommandKind::RemoveChannel] = {&CommandRouter::onRemoveChannel, true};
    routes_[CommandKind::RefreshVkGroups] = {&CommandRouter::onRefreshVkGroups, true};
    routes_[CommandKind::Timezone] = {&CommandRouter::onTimezone, false};
    routes_[CommandKind::Scheduled] = {&CommandRouter::onScheduled, true};
    routes_[CommandKind::History] = {&CommandRouter::onHistory, true};
    routes_[CommandKind::Cancel] = {&CommandRouter::onCancel, true};
    routes_[CommandKind::Reschedule] = {&CommandRouter::onReschedule, true};
    routes_[CommandKind::Post] = {&CommandRouter::onPost, true};
    routes_[CommandKind::ForwardedMessage] = {&CommandRouter::onForwarded, true};
    routes_[CommandKind::ChooseService] = {&CommandRouter::onChooseService, true};
    routes_[CommandKind::ChooseTarget] = {&CommandRouter::onChooseTarget, true};
    routes_[CommandKind::DraftTime] = {&CommandRouter::onDraftTime, true};
    routes_[CommandKind::SendNow] = {&CommandRouter::onSendNow, true};
}

std::string CommandRouter::errorMessage(Error error) {
    switch (error) {
        case Error::None: return "OK";
        case Error::NotAuthorized: return "Not authorized";
        case Error::AlreadyRejected: return "Access denied by administrator";
        case Error::QueueFull: return "Registration queue is full, try again later";
        case Error::InvalidOffset: return "Invalid timezone, use +HH:MM or -HH:MM";
        case Error::InvalidTime: return "Invalid time format, use HH:MM or DD.MM.YYYY HH:MM";
        case Error::TimeInPast: return "Time must be in future";
        case Error::InvalidState: return "Not possible in the current state";
        case Error::NotFound: return "Not found";
        case Error::StateConflict: return "Changed concurrently, try again";
        case Error::StorageUnavailable: return "Storage is unavailable, try again later";
    }
    return "Unknown error";
}

Reply CommandRouter::handle(const Command& command, const CommandContext& context) {
    auto it = routes_.find(command.kind);
    if (it == routes_.end()) {
        if (!access_.isAuthorized(context.user_id)) return text(errorMessage(Error::NotAuthorized));
        return onHelp(command, context);
    }

    if (it->second.authorized_only) {
        const Error err = access_.authorize(context.user_id);
        if (err != Error::None) return text(errorMessage(err));
    }
    return (this->*(it->second.handler))(command, context);
}

Reply CommandRouter::handleMessage(const IncomingMessage& message) {
    CommandContext context;
    context.user_id = message.from_id;
    context.username = message.from_username;
    context.message = message;

    if (message.forwarded) {
        Command forwarded;
        forwarded.kind = CommandKind::ForwardedMessage;
        return handle(forwarded, context);
    }

    Command command = parseCommandText(message.text);
    if (command.kind == CommandKind::Unknown && !message.text.empty() && message.text[0] != '/' &&
        awaitingTime(message.from_id)) {
        command.kind = CommandKind::DraftTime;
        command.args.push_back(message.text);
    }
    return handle(command, context);
}

Reply CommandRouter::handleCallback(const CallbackQuery& query) {
    CommandContext context;
    context.user_id = query.from_id;
    context.username = query.from_username;
    return handle(parseCallbackData(query.data), context);
}

bool CommandRouter::draftFor(int64_t user_id, SourceRef& out) {
    std::lock_guard<std::mutex> lock(drafts_mutex_);
    auto it = drafts_.find(user_id);
    if (it == drafts_.end()) return false;
    out = it->second.source;
    return true;
}

bool CommandRouter::draftFor(int64_t user_id, Draft& out) {
    std::lock_guard<std::mutex> lock(drafts_mutex_);
    auto it = drafts_.find(user_id);
    if (it == drafts_.end()) return false;
    out = it->second;
    return true;
}

bool CommandRouter::awaitingTime(int64_t user_id) {
    std::lock_guard<std::mutex> lock(drafts_mutex_);
    auto it = drafts_.find(user_id);
    return it != drafts_.end() && it->second.awaiting_time;
}

int CommandRouter::userOffset(int64_t user_id) {
    UserRecord user;
    if (access_.getUser(user_id, user) != Error::None) return 0;
    return user.tz_offset_minutes;
}

std::string CommandRouter::describePost(const ScheduledPost& post, int offset_minutes, bool with_results) {
    std::string line = "#" + std::to_string(post.id) + " " + formatLocal(post.dispatch_at, offset_minutes);
    if (with_results) line += std::string(" ") + postStateToString(post.state);
    line += " ->";
    for (size_t i = 0; i < post.targets.size(); i++) {
        const TargetResult& t = post.targets[i];
        line += (i == 0 ? " " : ", ") + targetTitle(t.target);
        if (!with_results) continue;
        if (t.outcome == TargetOutcome::Sent) {
            line += std::string(" (") + deliveryMethodToString(t.method) + ")";
        } else if (t.outcome == TargetOutcome::Failed) {
            line += std::string(" (failed: ") + deliveryErrorToString(t.error) + ")";
        }
    }
    return line;
}

void CommandRouter::notifyIfDue(const ScheduledPost& post) {
    if (on_due_now_ && post.dispatch_at <= schedule_.now()) on_due_now_();
}

// ========== ACCESS ==========

Reply CommandRouter::onStart(const Command&, const CommandContext& context) {
    UserState state = UserState::Pending;
    const Error err = access_.registerUser(context.user_id, context.username, state);
    if (err != Error::None) return text(errorMessage(err));

    switch (state) {
        case UserState::Superadmin: return text("You are superadmin");
        case UserState::Approved: return text("Bot is working");
        case UserState::Pending: return text("Your request is waiting for administrator approval");
        case UserState::Rejected: break;
    }
    return text(errorMessage(Error::AlreadyRejected));
}

Reply CommandRouter::onHelp(const Command&, const CommandContext&) {
    std::string body =
        "Forward a message here, then schedule it:\n"
        "/post <targets> <time|now> - targets like tg:-100123,vk:456; time HH:MM or DD.MM.YYYY HH:MM\n"
        "/channels - available targets, /remove_channel <tg|vk>:<id> - forget one\n"
        "/scheduled - your scheduled posts\n"
        "/history - your last posts\n"
        "/cancel <id>, /reschedule <id> <time>\n"
        "/tz <+HH:MM> - your timezone\n"
        "/pending, /approve <id>, /reject <id>, /remove_user <id>, /list_users - users";
    if (vk_enabled_) body += "\n/refresh_vkgroups - reload VK communities";
    return text(body);
}

Reply CommandRouter::onPending(const Command&, const CommandContext&) {
    std::vector<UserRecord> pending;
    const Error err = access_.listPending(pending);
    if (err != Error::None) return text(errorMessage(err));
    if (pending.empty()) return text("No pending requests");

    Reply reply;
    reply.parse_mode = "Markdown";
    reply.text = "Pending requests:";
    std::vector<std::vector<InlineButton>> rows;
    for (const auto& user : pending) {
        const std::string id = std::to_string(user.user_id);
        reply.text += "\n" + userLink(user) + " (" + id + ")";
        rows.push_back({{"Approve " + id, "approve:" + id}, {"Reject " + id, "reject:" + id}});
    }
    reply.reply_markup = JsonUtil::inlineKeyboard(rows);
    return reply;
}

Reply CommandRouter::onApprove(const Command& command, const CommandContext& context) {
    int64_t target = 0;
    if (command.args.size() != 1 || !parseId(command.args[0], target)) return text("Usage: /approve <user_id>");
    const Error err = access_.approve(context.user_id, target);
    if (err != Error::None) return text(errorMessage(err));
    return text("User " + std::to_string(target) + " approved");
}

Reply CommandRouter::onReject(const Command& command, const CommandContext& context) {
    int64_t target = 0;
    if (command.args.size() != 1 || !parseId(command.args[0], target)) return text("Usage: /reject <user_id>");
    const Error err = access_.reject(context.user_id, target);
    if (err != Error::None) return text(errorMessage(err));
    return text("User " + std::to_string(target) + " rejected");
}

Reply CommandRouter::onRemoveUser(const Command& command, const CommandContext& context) {
    int64_t target = 0;
    if (command.args.size() != 1 || !parseId(command.args[0], target)) return text("Usage: /remove_user <user_id>");
    const Error err = access_.remove(context.user_id, target);
    if (err != Error::None) return text(errorMessage(err));
    return text("User " + std::to_string(target) + " removed");
}

Reply CommandRouter::onListUsers(const Command&, const CommandContext&) {
    std::vector<UserRecord> users;
    const Error err = access_.listUsers(users);
    if (err != Error::None) return text(errorMessage(err));
    if (users.empty()) return text("No users");

    Reply reply;
    reply.parse_mode = "Markdown";
    for (const auto& user : users) {
        if (!reply.text.empty()) reply.text += "\n";
        reply.text += userLink(user) + " " + userStateToString(user.state) + " " + formatOffset(user.tz_offset_minutes);
    }
    return reply;
}

// ========== CHANNELS ==========

Reply CommandRouter::onChannels(const Command&, const CommandContext&) {
    std::vector<ChannelTarget> telegram;
    Error err = channels_.list(Platform::Telegram, telegram);
    if (err != Error::None) return text(errorMessage(err));
    std::vector<ChannelTarget> vk;
    err = channels_.list(Platform::Vk, vk);
    if (err != Error::None) return text(errorMessage(err));

    std::string body;
    for (const auto& t : telegram) {
        if (!body.empty()) body += "\n";
        body += t.title + " (" + std::to_string(t.external_id) + ")";
    }
    for (const auto& t : vk) {
        if (!body.empty()) body += "\n";
        body += "VK: " + t.title + " (" + std::to_string(t.external_id) + ")";
    }
    return text(body.empty() ? "No channels" : body);
}

Reply CommandRouter::onRemoveChannel(const Command& command, const CommandContext& context) {
    std::vector<TargetKey> keys;
    if (command.args.size() != 1 || !parseTargetList(command.args[0], keys) || keys.size() != 1) {
        return text("Usage: /remove_channel <tg|vk>:<id>");
    }
    const Error err = channels_.remove(keys[0].platform, keys[0].external_id);
    if (err == Error::NotFound) return text("Unknown target, see /channels");
    if (err != Error::None) return text(errorMessage(err));

    Logger::getInstance().info("Channel " + command.args[0] + " removed by " + std::to_string(context.user_id));
    return text("Channel " + command.args[0] + " removed");
}

Reply CommandRouter::onRefreshVkGroups(const Command&, const CommandContext&) {
    if (!vk_enabled_) return text("VK is not configured");

    std::vector<ChannelTarget> groups;
    std::string error;
    if (!channels_.refresh(Platform::Vk, groups, error)) return text("VK refresh failed: " + error);

    std::string body = "VK groups: " + std::to_string(groups.size());
    for (const auto& g : groups) {
        body += "\n" + g.title + " (" + std::to_string(g.external_id) + ")";
    }
    return text(body);
}

// ========== SCHEDULING ==========

Reply CommandRouter::onTimezone(const Command& command, const CommandContext& context) {
    if (command.args.empty()) {
        UserRecord user;
        const Error err = access_.getUser(context.user_id, user);
        if (err != Error::None) return text(errorMessage(err == Error::NotFound ? Error::NotAuthorized : err));
        return text("Your timezone: " + formatOffset(user.tz_offset_minutes));
    }
    if (command.args.size() != 1) return text("Usage: /tz <+HH:MM>");

    int offset = 0;
    Error err = parseOffset(command.args[0], offset);
    if (err != Error::None) return text(errorMessage(err));

    err = access_.setTimezone(context.user_id, command.args[0]);
    if (err == Error::NotFound) return text(errorMessage(Error::NotAuthorized));
    if (err != Error::None) return text(errorMessage(err));
    return text("Timezone set to " + formatOffset(offset));
}

Reply CommandRouter::onScheduled(const Command&, const CommandContext& context) {
    std::vector<ScheduledPost> posts;
    const Error err = schedule_.listScheduled(context.user_id, posts);
    if (err != Error::None) return text(errorMessage(err));
    if (posts.empty()) return text("No scheduled posts");

    const int offset = userOffset(context.user_id);
    Reply reply;
    std::vector<std::vector<InlineButton>> rows;
    for (const auto& post : posts) {
        if (!reply.text.empty()) reply.text += "\n";
        reply.text += describePost(post, offset, false);
        const std::string id = std::to_string(post.id);
        rows.push_back({{"Cancel #" + id, "cancel:" + id}});
    }
    reply.reply_markup = JsonUtil::inlineKeyboard(rows);
    return reply;
}

Reply CommandRouter::onHistory(const Command&, const CommandContext& context) {
    std::vector<ScheduledPost> posts;
    const Error err = schedule_.listHistory(context.user_id, kHistoryLimit, posts);
    if (err != Error::None) return text(errorMessage(err));
    if (posts.empty()) return text("No history");

    const int offset = userOffset(context.user_id);
    std::string body;
    for (const auto& post : posts) {
        if (!body.empty()) body += "\n";
        body += describePost(post, offset, true);
    }
    return text(body);
}

Reply CommandRouter::onCancel(const Command& command, const CommandContext& context) {
    int64_t id = 0;
    if (command.args.size() != 1 || !parseId(command.args[0], id)) return text("Usage: /cancel <post_id>");
    const Error err = schedule_.cancel(context.user_id, id);
    if (err != Error::None) return text(errorMessage(err));
    return text("Post #" + std::to_string(id) + " cancelled");
}

Reply CommandRouter::onReschedule(const Command& command, const CommandContext& context) {
    int64_t id = 0;
    if (command.args.size() < 2 || !parseId(command.args[0], id)) {
        return text("Usage: /reschedule <post_id> <HH:MM|DD.MM.YYYY HH:MM|now>");
    }

    ScheduledPost post;
    const Error err = schedule_.reschedule(context.user_id, id, joinFrom(command.args, 1), post);
    if (err != Error::None) return text(errorMessage(err));
    notifyIfDue(post);

    const std::string when = formatLocal(post.dispatch_at, userOffset(context.user_id));
    if (post.id != id) {
        return text("Post #" + std::to_string(id) + " scheduled again as #" + std::to_string(post.id) +
                    " for " + when);
    }
    return text("Post #" + std::to_string(id) + " rescheduled for " + when);
}

Reply CommandRouter::submit(const PostRequest& request) {
    ScheduledPost post;
    const Error err = schedule_.schedulePost(request, post);
    if (err == Error::NotFound) return text("Unknown target, see /channels");
    if (err != Error::None) return text(errorMessage(err));

    {
        std::lock_guard<std::mutex> lock(drafts_mutex_);
        drafts_.erase(request.owner_id);
    }
    notifyIfDue(post);
    return text("Post #" + std::to_string(post.id) + " scheduled for " +
                formatLocal(post.dispatch_at, post.tz_offset_minutes));
}

Reply CommandRouter::onPost(const Command& command, const CommandContext& context) {
    if (command.args.size() < 2) return text("Usage: /post <targets> <HH:MM|DD.MM.YYYY HH:MM|now>");

    PostRequest request;
    request.owner_id = context.user_id;
    if (!draftFor(context.user_id, request.source)) return text("Forward a message to schedule first");
    if (!parseTargetList(command.args[0], request.targets)) {
        return text("Invalid targets, use tg:<id> or vk:<id> separated by commas");
    }
    request.local_time = joinFrom(command.args, 1);
    return submit(request);
}

Reply CommandRouter::onForwarded(const Command&, const CommandContext& context) {
    const IncomingMessage& message = context.message;

    std::vector<ChannelTarget> telegram;
    Error err = channels_.list(Platform::Telegram, telegram);
    if (err != Error::None) return text(errorMessage(err));
    std::vector<ChannelTarget> vk;
    if (vk_enabled_) {
        err = channels_.list(Platform::Vk, vk);
        if (err != Error::None) return text(errorMessage(err));
    }
    if (telegram.empty() && vk.empty()) return text("No channels available");

    Draft draft;
    if (message.origin_chat_id != 0 && message.origin_message_id != 0) {
        draft.source.chat_id = message.origin_chat_id;
        draft.source.message_id = message.origin_message_id;
    } else {
        draft.source.chat_id = message.chat_id;
        draft.source.message_id = message.message_id;
    }
    draft.source.caption = message.text;
    draft.source.photo_file_id = message.photo_file_id;
    {
        std::lock_guard<std::mutex> lock(drafts_mutex_);
        drafts_[context.user_id] = draft;
    }
    Logger::getInstance().debug("Draft saved for " + std::to_string(context.user_id) + ": " +
                                std::to_string(draft.source.chat_id) + "/" +
                                std::to_string(draft.source.message_id));

    Reply reply;
    reply.text = "Message saved. Targets:";
    std::vector<InlineButton> services;
    if (!telegram.empty()) services.push_back({"Telegram", "svc:tg"});
    if (!vk.empty()) services.push_back({"VK", "svc:vk"});
    telegram.insert(telegram.end(), vk.begin(), vk.end());
    for (const auto& t : telegram) {
        reply.text += std::string("\n") + platformToString(t.platform) + ":" + std::to_string(t.external_id) +
                      " " + targetTitle(t);
    }
    reply.text += "\nChoose a service or schedule with /post <targets> <HH:MM|DD.MM.YYYY HH:MM|now>";
    std::vector<std::vector<InlineButton>> rows;
    rows.push_back(services);
    reply.reply_markup = JsonUtil::inlineKeyboard(rows);
    return reply;
}

Reply CommandRouter::onChooseService(const Command& command, const CommandContext& context) {
    Platform platform = Platform::Telegram;
    if (command.args.size() != 1 || !platformFromString(command.args[0], platform)) {
        return text("Unknown service");
    }
    if (platform == Platform::Vk && !vk_enabled_) return text("VK is not configured");

    {
        std::lock_guard<std::mutex> lock(drafts_mutex_);
        auto it = drafts_.find(context.user_id);
        if (it == drafts_.end()) return text("Forward a message to schedule first");
        it->second.has_target = false;
        it->second.awaiting_time = false;
    }

    std::vector<ChannelTarget> targets;
    const Error err = channels_.list(platform, targets);
    if (err != Error::None) return text(errorMessage(err));
    if (targets.empty()) return text("No channels available");

    const std::string prefix = platform == Platform::Vk ? "vkgrp:" : "tgch:";
    std::vector<std::vector<InlineButton>> rows;
    for (const auto& t : targets) {
        rows.push_back({{targetTitle(t), prefix + std::to_string(t.external_id)}});
    }

    Reply reply;
    reply.text = platform == Platform::Vk ? "Choose a VK community:" : "Choose a channel:";
    reply.reply_markup = JsonUtil::inlineKeyboard(rows);
    return reply;
}

Reply CommandRouter::onChooseTarget(const Command& command, const CommandContext& context) {
    std::vector<TargetKey> keys;
    if (command.args.size() != 1 || !parseTargetList(command.args[0], keys) || keys.size() != 1) {
        return text("Unknown target, see /channels");
    }

    ChannelTarget target;
    const Error err = channels_.find(keys[0].platform, keys[0].external_id, target);
    if (err == Error::NotFound) return text("Unknown target, see /channels");
    if (err != Error::None) return text(errorMessage(err));

    {
        std::lock_guard<std::mutex> lock(drafts_mutex_);
        auto it = drafts_.find(context.user_id);
        if (it == drafts_.end()) return text("Forward a message to schedule first");
        it->second.has_target = true;
        it->second.target = keys[0];
        it->second.awaiting_time = true;
    }

    Reply reply;
    reply.text = "Selected " + targetTitle(target) + ". Enter time (HH:MM or DD.MM.YYYY HH:MM)";
    std::vector<std::vector<InlineButton>> rows;
    rows.push_back({{"Send now", "sendnow"}});
    reply.reply_markup = JsonUtil::inlineKeyboard(rows);
    return reply;
}

Reply CommandRouter::onDraftTime(const Command& command, const CommandContext& context) {
    if (command.args.size() != 1) return text(errorMessage(Error::InvalidTime));
    return scheduleDraftTarget(context.user_id, command.args[0]);
}

Reply CommandRouter::onSendNow(const Command&, const CommandContext& context) {
    return scheduleDraftTarget(context.user_id, "now");
}

Reply CommandRouter::scheduleDraftTarget(int64_t user_id, const std::string& local_time) {
    Draft draft;
    if (!draftFor(user_id, draft)) return text("Forward a message to schedule first");
    if (!draft.has_target) return text("Choose a target first");

    PostRequest request;
    request.owner_id = user_id;
    request.source = draft.source;
    request.targets.push_back(draft.target);
    request.local_time = local_time;
    // A rejected time keeps the draft waiting for another one.
    return submit(request);
}

} // namespace postsched

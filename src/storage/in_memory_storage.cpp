#include "../../include/storage/in_memory_storage.hpp"
#include "../../include/scheduler/timezone.hpp"

#include <algorithm>

namespace postsched {

namespace {

std::pair<int, int64_t> channelKey(Platform platform, int64_t external_id) {
    return {static_cast<int>(platform), external_id};
}

bool sameTarget(const ChannelTarget& a, const ChannelTarget& b) {
    return a.platform == b.platform && a.external_id == b.external_id;
}

bool ownerMatches(const std::optional<int64_t>& owner_id, const ScheduledPost& post) {
    return !owner_id || *owner_id == post.owner_id;
}

} // namespace

// ========== USERS ==========

int InMemoryStorage::countByStateLocked(UserState state) const {
    int count = 0;
    for (const auto& kv : users_) {
        if (kv.second.state == state) count++;
    }
    return count;
}

Error InMemoryStorage::findUser(int64_t user_id, UserRecord& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return Error::NotFound;
    out = it->second;
    return Error::None;
}

Error InMemoryStorage::insertSuperadmin(const UserRecord& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.count(user.user_id) || countByStateLocked(UserState::Superadmin) > 0) {
        return Error::StateConflict;
    }
    UserRecord rec = user;
    rec.state = UserState::Superadmin;
    users_[rec.user_id] = rec;
    user_order_[rec.user_id] = ++user_seq_;
    return Error::None;
}

Error InMemoryStorage::insertPending(const UserRecord& user, int pending_cap) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.count(user.user_id)) return Error::StateConflict;
    if (countByStateLocked(UserState::Pending) >= pending_cap) return Error::QueueFull;
    UserRecord rec = user;
    rec.state = UserState::Pending;
    users_[rec.user_id] = rec;
    user_order_[rec.user_id] = ++user_seq_;
    return Error::None;
}

Error InMemoryStorage::updateUserState(int64_t user_id, UserState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return Error::NotFound;
    it->second.state = state;
    return Error::None;
}

Error InMemoryStorage::updateUserTimezone(int64_t user_id, int offset_minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) return Error::NotFound;
    it->second.tz_offset_minutes = offset_minutes;
    return Error::None;
}

Error InMemoryStorage::deleteUser(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.erase(user_id) == 0) return Error::NotFound;
    user_order_.erase(user_id);
    return Error::None;
}

Error InMemoryStorage::listUsers(std::vector<UserRecord>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    for (const auto& kv : users_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [this](const UserRecord& a, const UserRecord& b) {
        return user_order_.at(a.user_id) < user_order_.at(b.user_id);
    });
    return Error::None;
}

Error InMemoryStorage::listUsersByState(UserState state, std::vector<UserRecord>& out) {
    std::vector<UserRecord> all;
    const Error err = listUsers(all);
    if (err != Error::None) return err;
    out.clear();
    for (auto& u : all) {
        if (u.state == state) out.push_back(std::move(u));
    }
    return Error::None;
}

// ========== CHANNELS ==========

Error InMemoryStorage::upsertChannel(const ChannelTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[channelKey(target.platform, target.external_id)] = target;
    return Error::None;
}

Error InMemoryStorage::replaceChannels(Platform platform, const std::vector<ChannelTarget>& targets) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = channels_.begin(); it != channels_.end();) {
        if (it->second.platform == platform) {
            it = channels_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& t : targets) {
        ChannelTarget copy = t;
        copy.platform = platform;
        channels_[channelKey(platform, copy.external_id)] = copy;
    }
    return Error::None;
}

Error InMemoryStorage::findChannel(Platform platform, int64_t external_id, ChannelTarget& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channelKey(platform, external_id));
    if (it == channels_.end()) return Error::NotFound;
    out = it->second;
    return Error::None;
}

Error InMemoryStorage::listChannels(Platform platform, std::vector<ChannelTarget>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    for (const auto& kv : channels_) {
        if (kv.second.platform == platform) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const ChannelTarget& a, const ChannelTarget& b) {
        if (a.title != b.title) return a.title < b.title;
        return a.external_id < b.external_id;
    });
    return Error::None;
}

Error InMemoryStorage::deleteChannel(Platform platform, int64_t external_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (channels_.erase(channelKey(platform, external_id)) == 0) return Error::NotFound;
    return Error::None;
}

// ========== SCHEDULE ==========

Error InMemoryStorage::createPost(ScheduledPost& post) {
    std::lock_guard<std::mutex> lock(mutex_);
    post.id = next_post_id_++;
    post.state = PostState::Scheduled;
    if (post.created_at == 0) post.created_at = nowUtc();
    post.updated_at = post.created_at;
    posts_[post.id] = post;
    return Error::None;
}

Error InMemoryStorage::getPost(int64_t id, ScheduledPost& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = posts_.find(id);
    if (it == posts_.end()) return Error::NotFound;
    out = it->second;
    return Error::None;
}

Error InMemoryStorage::listDue(UnixTime now, std::vector<ScheduledPost>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    for (const auto& kv : posts_) {
        if (kv.second.state == PostState::Scheduled && kv.second.dispatch_at <= now) {
            out.push_back(kv.second);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ScheduledPost& a, const ScheduledPost& b) {
        return a.dispatch_at < b.dispatch_at;
    });
    return Error::None;
}

Error InMemoryStorage::listScheduled(std::optional<int64_t> owner_id, std::vector<ScheduledPost>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    for (const auto& kv : posts_) {
        if (kv.second.state == PostState::Scheduled && ownerMatches(owner_id, kv.second)) {
            out.push_back(kv.second);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ScheduledPost& a, const ScheduledPost& b) {
        return a.dispatch_at < b.dispatch_at;
    });
    return Error::None;
}

Error InMemoryStorage::listHistory(std::optional<int64_t> owner_id, int limit, std::vector<ScheduledPost>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    // Iterate newest id first so equal instants keep newest-first order.
    for (auto it = posts_.rbegin(); it != posts_.rend(); ++it) {
        if (isTerminal(it->second.state) && ownerMatches(owner_id, it->second)) {
            out.push_back(it->second);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ScheduledPost& a, const ScheduledPost& b) {
        return a.dispatch_at > b.dispatch_at;
    });
    if (limit >= 0 && out.size() > static_cast<size_t>(limit)) {
        out.resize(static_cast<size_t>(limit));
    }
    return Error::None;
}

Error InMemoryStorage::transition(int64_t id, PostState from, PostState to,
                                  const std::vector<TargetResult>& results) {
    if (!isAllowedTransition(from, to)) return Error::InvalidState;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = posts_.find(id);
    if (it == posts_.end()) return Error::NotFound;
    ScheduledPost& post = it->second;
    if (post.state != from) return Error::StateConflict;

    post.state = to;
    post.updated_at = nowUtc();
    for (const auto& r : results) {
        for (auto& t : post.targets) {
            if (sameTarget(t.target, r.target)) {
                t.outcome = r.outcome;
                t.method = r.method;
                t.message_ref = r.message_ref;
                t.error = r.error;
                t.error_text = r.error_text;
            }
        }
    }
    return Error::None;
}

Error InMemoryStorage::cancel(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = posts_.find(id);
    if (it == posts_.end()) return Error::NotFound;
    if (it->second.state != PostState::Scheduled) return Error::InvalidState;
    it->second.state = PostState::Cancelled;
    it->second.updated_at = nowUtc();
    return Error::None;
}

Error InMemoryStorage::reschedule(int64_t id, UnixTime dispatch_at,
                                  const std::string& requested_local, int offset_minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = posts_.find(id);
    if (it == posts_.end()) return Error::NotFound;
    if (it->second.state != PostState::Scheduled) return Error::InvalidState;
    it->second.dispatch_at = dispatch_at;
    it->second.requested_local = requested_local;
    it->second.tz_offset_minutes = offset_minutes;
    it->second.updated_at = nowUtc();
    return Error::None;
}

} // namespace postsched

// Scheduled posts and their per-target delivery results

#include "../../include/database/db_manager.hpp"
#include "../../include/scheduler/timezone.hpp"
#include "../../include/utils/logger.hpp"

#include <libpq-fe.h>

namespace postsched {

namespace {

ScheduledPost readPost(const PGresult* res, int row) {
    ScheduledPost p;
    p.id = DatabaseConnection::getInt64(res, row, 0);
    p.owner_id = DatabaseConnection::getInt64(res, row, 1);
    p.source.chat_id = DatabaseConnection::getInt64(res, row, 2);
    p.source.message_id = DatabaseConnection::getInt64(res, row, 3);
    p.source.caption = DatabaseConnection::getString(res, row, 4);
    p.requested_local = DatabaseConnection::getString(res, row, 5);
    p.tz_offset_minutes = static_cast<int>(DatabaseConnection::getInt64(res, row, 6));
    p.dispatch_at = DatabaseConnection::getInt64(res, row, 7);
    postStateFromString(DatabaseConnection::getString(res, row, 8), p.state);
    p.created_at = DatabaseConnection::getInt64(res, row, 9);
    p.updated_at = DatabaseConnection::getInt64(res, row, 10);
    p.source.photo_file_id = DatabaseConnection::getString(res, row, 11);
    return p;
}

TargetResult readTarget(const PGresult* res, int row) {
    TargetResult r;
    platformFromString(DatabaseConnection::getString(res, row, 0), r.target.platform);
    r.target.external_id = DatabaseConnection::getInt64(res, row, 1);
    r.target.title = DatabaseConnection::getString(res, row, 2);
    targetOutcomeFromString(DatabaseConnection::getString(res, row, 3), r.outcome);
    deliveryMethodFromString(DatabaseConnection::getString(res, row, 4), r.method);
    r.message_ref = DatabaseConnection::getString(res, row, 5);
    deliveryErrorFromString(DatabaseConnection::getString(res, row, 6), r.error);
    r.error_text = DatabaseConnection::getString(res, row, 7);
    return r;
}

} // namespace

Error DatabaseManager::loadTargets(ScheduledPost& post) {
    const std::string id = std::to_string(post.id);
    const char* params[1] = {id.c_str()};
    PGresult* res = db_->executePrepared("get_post_targets", 1, params);
    if (!res) return Error::StorageUnavailable;
    const int rows = PQntuples(res);
    post.targets.clear();
    post.targets.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; i++) {
        post.targets.push_back(readTarget(res, i));
    }
    PQclear(res);
    return Error::None;
}

Error DatabaseManager::listPostsWith(const char* stmt, int n_params, const char* const* params,
                                     std::vector<ScheduledPost>& out) {
    out.clear();
    PGresult* res = db_->executePrepared(stmt, n_params, params);
    if (!res) return Error::StorageUnavailable;
    const int rows = PQntuples(res);
    out.reserve(static_cast<size_t>(rows));
    for (int i = 0; i < rows; i++) {
        out.push_back(readPost(res, i));
    }
    PQclear(res);

    for (auto& post : out) {
        const Error err = loadTargets(post);
        if (err != Error::None) return err;
    }
    return Error::None;
}

Error DatabaseManager::postExistsWithState(int64_t id, PostState& out_state) {
    const std::string sid = std::to_string(id);
    const char* params[1] = {sid.c_str()};
    PGresult* res = db_->executePrepared("get_post_state", 1, params);
    if (!res) return Error::StorageUnavailable;
    if (PQntuples(res) == 0) {
        PQclear(res);
        return Error::NotFound;
    }
    postStateFromString(DatabaseConnection::getString(res, 0, 0), out_state);
    PQclear(res);
    return Error::None;
}

Error DatabaseManager::createPost(ScheduledPost& post) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (post.created_at == 0) post.created_at = nowUtc();

    if (!db_->begin()) return Error::StorageUnavailable;

    const std::string owner = std::to_string(post.owner_id);
    const std::string chat = std::to_string(post.source.chat_id);
    const std::string msg = std::to_string(post.source.message_id);
    const std::string tz = std::to_string(post.tz_offset_minutes);
    const std::string at = std::to_string(post.dispatch_at);
    const std::string created = std::to_string(post.created_at);
    const char* params[9] = {
        owner.c_str(),
        chat.c_str(),
        msg.c_str(),
        post.source.caption.c_str(),
        post.requested_local.c_str(),
        tz.c_str(),
        at.c_str(),
        created.c_str(),
        post.source.photo_file_id.c_str()
    };
    PGresult* res = db_->executePrepared("insert_post", 9, params);
    if (!res || PQntuples(res) == 0) {
        if (res) PQclear(res);
        db_->rollback();
        return Error::StorageUnavailable;
    }
    const int64_t id = DatabaseConnection::getInt64(res, 0, 0);
    PQclear(res);

    const std::string sid = std::to_string(id);
    for (size_t i = 0; i < post.targets.size(); i++) {
        const ChannelTarget& t = post.targets[i].target;
        const std::string position = std::to_string(i);
        const std::string ext = std::to_string(t.external_id);
        const char* tparams[5] = {
            sid.c_str(),
            position.c_str(),
            platformToString(t.platform),
            ext.c_str(),
            t.title.c_str()
        };
        if (execCommand("insert_post_target", 5, tparams) != Error::None) {
            db_->rollback();
            return Error::StorageUnavailable;
        }
    }

    if (!db_->commit()) return Error::StorageUnavailable;

    post.id = id;
    post.state = PostState::Scheduled;
    post.updated_at = post.created_at;
    return Error::None;
}

Error DatabaseManager::getPost(int64_t id, ScheduledPost& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sid = std::to_string(id);
    const char* params[1] = {sid.c_str()};
    std::vector<ScheduledPost> rows;
    const Error err = listPostsWith("get_post", 1, params, rows);
    if (err != Error::None) return err;
    if (rows.empty()) return Error::NotFound;
    out = std::move(rows.front());
    return Error::None;
}

Error DatabaseManager::listDue(UnixTime now, std::vector<ScheduledPost>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string at = std::to_string(now);
    const char* params[1] = {at.c_str()};
    return listPostsWith("list_due_posts", 1, params, out);
}

Error DatabaseManager::listScheduled(std::optional<int64_t> owner_id, std::vector<ScheduledPost>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string owner = owner_id ? std::to_string(*owner_id) : "";
    const char* params[1] = {owner_id ? owner.c_str() : nullptr};
    return listPostsWith("list_scheduled_posts", 1, params, out);
}

Error DatabaseManager::listHistory(std::optional<int64_t> owner_id, int limit, std::vector<ScheduledPost>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string owner = owner_id ? std::to_string(*owner_id) : "";
    const std::string lim = std::to_string(limit < 0 ? 0 : limit);
    const char* params[2] = {owner_id ? owner.c_str() : nullptr, lim.c_str()};
    return listPostsWith("list_history_posts", 2, params, out);
}

Error DatabaseManager::transition(int64_t id, PostState from, PostState to,
                                  const std::vector<TargetResult>& results) {
    if (!isAllowedTransition(from, to)) return Error::InvalidState;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_->begin()) return Error::StorageUnavailable;

    const std::string sid = std::to_string(id);
    const std::string at = std::to_string(nowUtc());
    const char* params[4] = {sid.c_str(), postStateToString(from), postStateToString(to), at.c_str()};
    PGresult* res = db_->executePrepared("transition_post", 4, params);
    if (!res) {
        db_->rollback();
        return Error::StorageUnavailable;
    }
    const bool swapped = PQntuples(res) > 0;
    PQclear(res);

    if (!swapped) {
        PostState current = PostState::Scheduled;
        const Error lookup = postExistsWithState(id, current);
        db_->rollback();
        if (lookup != Error::None) return lookup;
        return Error::StateConflict;
    }

    for (const auto& r : results) {
        const std::string ext = std::to_string(r.target.external_id);
        const char* tparams[8] = {
            sid.c_str(),
            platformToString(r.target.platform),
            ext.c_str(),
            targetOutcomeToString(r.outcome),
            deliveryMethodToString(r.method),
            r.message_ref.c_str(),
            deliveryErrorToString(r.error),
            r.error_text.c_str()
        };
        if (execCommand("update_post_target", 8, tparams) != Error::None) {
            db_->rollback();
            return Error::StorageUnavailable;
        }
    }

    if (!db_->commit()) return Error::StorageUnavailable;
    return Error::None;
}

Error DatabaseManager::cancel(int64_t id) {
    const Error err = transition(id, PostState::Scheduled, PostState::Cancelled, {});
    if (err == Error::StateConflict) return Error::InvalidState;
    return err;
}

Error DatabaseManager::reschedule(int64_t id, UnixTime dispatch_at,
                                  const std::string& requested_local, int offset_minutes) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sid = std::to_string(id);
    const std::string at = std::to_string(dispatch_at);
    const std::string tz = std::to_string(offset_minutes);
    const std::string now = std::to_string(nowUtc());
    const char* params[5] = {sid.c_str(), at.c_str(), requested_local.c_str(), tz.c_str(), now.c_str()};
    PGresult* res = db_->executePrepared("reschedule_post", 5, params);
    if (!res) return Error::StorageUnavailable;
    const bool updated = PQntuples(res) > 0;
    PQclear(res);
    if (updated) return Error::None;

    PostState current = PostState::Scheduled;
    const Error lookup = postExistsWithState(id, current);
    if (lookup != Error::None) return lookup;
    return Error::InvalidState;
}

} // namespace postsched

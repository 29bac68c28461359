#include "../../include/database/db_manager.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

DatabaseManager::DatabaseManager(const std::string& host,
                                const std::string& port,
                                const std::string& dbname,
                                const std::string& user,
                                const std::string& password) {
    db_ = std::make_unique<DatabaseConnection>(host, port, dbname, user, password);
}

bool DatabaseManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_->connect()) {
        Logger::getInstance().error("Failed to connect to database");
        return false;
    }
    if (!createSchema()) {
        Logger::getInstance().error("Failed to create database schema: " + db_->getLastError());
        return false;
    }
    if (!prepareStatements()) {
        Logger::getInstance().error("Failed to prepare database statements");
        return false;
    }
    return true;
}

bool DatabaseManager::createSchema() {
    static const char* const kSchema[] = {
        "CREATE TABLE IF NOT EXISTS users ("
        "  user_id bigint PRIMARY KEY,"
        "  username text NOT NULL DEFAULT '',"
        "  state varchar(16) NOT NULL DEFAULT 'pending'"
        "    CHECK (state IN ('pending','approved','rejected','superadmin')),"
        "  tz_offset_minutes integer NOT NULL DEFAULT 0,"
        "  created_at bigint NOT NULL,"
        "  seq bigserial"
        ")",
        // exactly one superadmin
        "CREATE UNIQUE INDEX IF NOT EXISTS idx_users_single_superadmin "
        "ON users ((state)) WHERE state = 'superadmin'",

        "CREATE TABLE IF NOT EXISTS channels ("
        "  platform varchar(8) NOT NULL CHECK (platform IN ('tg','vk')),"
        "  external_id bigint NOT NULL,"
        "  title text NOT NULL DEFAULT '',"
        "  can_post boolean NOT NULL DEFAULT TRUE,"
        "  PRIMARY KEY (platform, external_id)"
        ")",

        "CREATE TABLE IF NOT EXISTS scheduled_posts ("
        "  id bigserial PRIMARY KEY,"
        "  owner_id bigint NOT NULL,"
        "  source_chat_id bigint NOT NULL,"
        "  source_message_id bigint NOT NULL,"
        "  caption text NOT NULL DEFAULT '',"
        "  requested_local text NOT NULL DEFAULT '',"
        "  tz_offset_minutes integer NOT NULL DEFAULT 0,"
        "  dispatch_at bigint NOT NULL,"
        "  state varchar(16) NOT NULL DEFAULT 'scheduled'"
        "    CHECK (state IN ('scheduled','dispatching','sent','failed','cancelled')),"
        "  created_at bigint NOT NULL,"
        "  updated_at bigint NOT NULL"
        ")",
        "ALTER TABLE scheduled_posts ADD COLUMN IF NOT EXISTS photo_file_id text NOT NULL DEFAULT ''",
        "CREATE INDEX IF NOT EXISTS idx_scheduled_posts_due "
        "ON scheduled_posts (dispatch_at) WHERE state = 'scheduled'",
        "CREATE INDEX IF NOT EXISTS idx_scheduled_posts_owner "
        "ON scheduled_posts (owner_id, dispatch_at)",

        "CREATE TABLE IF NOT EXISTS post_targets ("
        "  post_id bigint NOT NULL REFERENCES scheduled_posts(id) ON DELETE CASCADE,"
        "  position integer NOT NULL,"
        "  platform varchar(8) NOT NULL,"
        "  external_id bigint NOT NULL,"
        "  title text NOT NULL DEFAULT '',"
        "  outcome varchar(16) NOT NULL DEFAULT 'pending',"
        "  method varchar(16) NOT NULL DEFAULT 'none',"
        "  message_ref text NOT NULL DEFAULT '',"
        "  error_kind varchar(16) NOT NULL DEFAULT 'none',"
        "  error_text text NOT NULL DEFAULT '',"
        "  PRIMARY KEY (post_id, position)"
        ")",
    };

    for (const char* stmt : kSchema) {
        PGresult* res = db_->executeQuery(stmt);
        if (!res) return false;
        PQclear(res);
    }
    Logger::getInstance().info("Database schema ensured");
    return true;
}

bool DatabaseManager::prepareStatements() {
    bool ok = true;

    // Users
    ok &= db_->prepareStatement("find_user",
        "SELECT user_id, username, state, tz_offset_minutes, created_at "
        "FROM users WHERE user_id = $1::bigint");
    ok &= db_->prepareStatement("insert_superadmin",
        "INSERT INTO users (user_id, username, state, tz_offset_minutes, created_at) "
        "SELECT $1::bigint, $2, 'superadmin', $3::integer, $4::bigint "
        "WHERE NOT EXISTS (SELECT 1 FROM users WHERE state = 'superadmin') "
        "ON CONFLICT DO NOTHING "
        "RETURNING user_id");
    // Serializes concurrent registrations so the pending cap holds.
    ok &= db_->prepareStatement("lock_registration",
        "SELECT pg_advisory_xact_lock(hashtext('postsched.registration'))");
    ok &= db_->prepareStatement("count_users_by_state",
        "SELECT count(*) FROM users WHERE state = $1");
    ok &= db_->prepareStatement("insert_pending_user",
        "INSERT INTO users (user_id, username, state, tz_offset_minutes, created_at) "
        "VALUES ($1::bigint, $2, 'pending', $3::integer, $4::bigint) "
        "ON CONFLICT DO NOTHING "
        "RETURNING user_id");
    ok &= db_->prepareStatement("update_user_state",
        "UPDATE users SET state = $2 WHERE user_id = $1::bigint RETURNING user_id");
    ok &= db_->prepareStatement("update_user_timezone",
        "UPDATE users SET tz_offset_minutes = $2::integer WHERE user_id = $1::bigint RETURNING user_id");
    ok &= db_->prepareStatement("delete_user",
        "DELETE FROM users WHERE user_id = $1::bigint RETURNING user_id");
    ok &= db_->prepareStatement("list_users",
        "SELECT user_id, username, state, tz_offset_minutes, created_at "
        "FROM users ORDER BY created_at ASC, seq ASC");
    ok &= db_->prepareStatement("list_users_by_state",
        "SELECT user_id, username, state, tz_offset_minutes, created_at "
        "FROM users WHERE state = $1 ORDER BY created_at ASC, seq ASC");

    // Channels
    ok &= db_->prepareStatement("upsert_channel",
        "INSERT INTO channels (platform, external_id, title, can_post) "
        "VALUES ($1, $2::bigint, $3, $4::boolean) "
        "ON CONFLICT (platform, external_id) DO UPDATE "
        "SET title = EXCLUDED.title, can_post = EXCLUDED.can_post");
    ok &= db_->prepareStatement("delete_channels_by_platform",
        "DELETE FROM channels WHERE platform = $1");
    ok &= db_->prepareStatement("find_channel",
        "SELECT platform, external_id, title, can_post FROM channels "
        "WHERE platform = $1 AND external_id = $2::bigint");
    ok &= db_->prepareStatement("list_channels",
        "SELECT platform, external_id, title, can_post FROM channels "
        "WHERE platform = $1 ORDER BY title ASC, external_id ASC");
    ok &= db_->prepareStatement("delete_channel",
        "DELETE FROM channels WHERE platform = $1 AND external_id = $2::bigint RETURNING external_id");

    // Scheduled posts
    const std::string post_columns =
        "SELECT id, owner_id, source_chat_id, source_message_id, caption, requested_local, "
        "tz_offset_minutes, dispatch_at, state, created_at, updated_at, photo_file_id FROM scheduled_posts ";
    ok &= db_->prepareStatement("insert_post",
        "INSERT INTO scheduled_posts (owner_id, source_chat_id, source_message_id, caption, "
        "requested_local, tz_offset_minutes, dispatch_at, state, created_at, updated_at, photo_file_id) "
        "VALUES ($1::bigint, $2::bigint, $3::bigint, $4, $5, $6::integer, $7::bigint, 'scheduled', "
        "$8::bigint, $8::bigint, $9) "
        "RETURNING id");
    ok &= db_->prepareStatement("insert_post_target",
        "INSERT INTO post_targets (post_id, position, platform, external_id, title) "
        "VALUES ($1::bigint, $2::integer, $3, $4::bigint, $5)");
    ok &= db_->prepareStatement("get_post", post_columns + "WHERE id = $1::bigint");
    ok &= db_->prepareStatement("get_post_targets",
        "SELECT platform, external_id, title, outcome, method, message_ref, error_kind, error_text "
        "FROM post_targets WHERE post_id = $1::bigint ORDER BY position ASC");
    ok &= db_->prepareStatement("list_due_posts",
        post_columns + "WHERE state = 'scheduled' AND dispatch_at <= $1::bigint "
        "ORDER BY dispatch_at ASC, id ASC");
    ok &= db_->prepareStatement("list_scheduled_posts",
        post_columns + "WHERE state = 'scheduled' AND ($1::bigint IS NULL OR owner_id = $1::bigint) "
        "ORDER BY dispatch_at ASC, id ASC");
    ok &= db_->prepareStatement("list_history_posts",
        post_columns + "WHERE state IN ('sent','failed','cancelled') "
        "AND ($1::bigint IS NULL OR owner_id = $1::bigint) "
        "ORDER BY dispatch_at DESC, id DESC LIMIT $2::integer");
    ok &= db_->prepareStatement("get_post_state",
        "SELECT state FROM scheduled_posts WHERE id = $1::bigint");
    // Compare-and-swap: only rows still in the expected state are touched.
    ok &= db_->prepareStatement("transition_post",
        "UPDATE scheduled_posts SET state = $3, updated_at = $4::bigint "
        "WHERE id = $1::bigint AND state = $2 "
        "RETURNING id");
    ok &= db_->prepareStatement("update_post_target",
        "UPDATE post_targets SET outcome = $4, method = $5, message_ref = $6, "
        "error_kind = $7, error_text = $8 "
        "WHERE post_id = $1::bigint AND platform = $2 AND external_id = $3::bigint");
    ok &= db_->prepareStatement("reschedule_post",
        "UPDATE scheduled_posts SET dispatch_at = $2::bigint, requested_local = $3, "
        "tz_offset_minutes = $4::integer, updated_at = $5::bigint "
        "WHERE id = $1::bigint AND state = 'scheduled' "
        "RETURNING id");

    return ok;
}

Error DatabaseManager::execCommand(const char* stmt, int n_params, const char* const* params) {
    PGresult* res = db_->executePrepared(stmt, n_params, params);
    if (!res) return Error::StorageUnavailable;
    PQclear(res);
    return Error::None;
}

} // namespace postsched

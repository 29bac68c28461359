#include "../../include/utils/config.hpp"
#include "../../include/scheduler/timezone.hpp"

#include <cctype>
#include <cstdlib>

namespace postsched {

namespace {

const char* const kKnownKeys[] = {
    "TELEGRAM_BOT_TOKEN",
    "VK_TOKEN",
    "VK_GROUP_ID",
    "VK_API_VERSION",
    "POSTSCHED_STORAGE",
    "POSTSCHED_DB_HOST",
    "POSTSCHED_DB_PORT",
    "POSTSCHED_DB_NAME",
    "POSTSCHED_DB_USER",
    "POSTSCHED_DB_PASSWORD",
    "POSTSCHED_DEFAULT_TZ",
    "POSTSCHED_DISPATCH_INTERVAL_SECONDS",
    "POSTSCHED_REGISTRATION_QUEUE_CAP",
    "POSTSCHED_PLATFORM_TIMEOUT_SECONDS",
    "POSTSCHED_POLL_TIMEOUT_SECONDS",
    "POSTSCHED_LOG_FILE",
    "POSTSCHED_LOG_LEVEL",
};

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

void readString(const std::map<std::string, std::string>& env, const char* key, std::string& field) {
    auto it = env.find(key);
    if (it != env.end() && !it->second.empty()) field = it->second;
}

bool readInt(const std::map<std::string, std::string>& env,
             const char* key, int min_value, int max_value,
             int& field, std::string& error) {
    auto it = env.find(key);
    if (it == env.end() || it->second.empty()) return true;
    if (!allDigits(it->second) || it->second.size() > 9) {
        error = std::string(key) + " must be an integer, got '" + it->second + "'";
        return false;
    }
    const int value = std::stoi(it->second);
    if (value < min_value || value > max_value) {
        error = std::string(key) + " must be within [" + std::to_string(min_value) + ", " +
                std::to_string(max_value) + "], got " + it->second;
        return false;
    }
    field = value;
    return true;
}

} // namespace

bool Config::fromMap(const std::map<std::string, std::string>& env, Config& out, std::string& error) {
    Config cfg;

    readString(env, "TELEGRAM_BOT_TOKEN", cfg.telegram_token);
    if (cfg.telegram_token.empty()) {
        error = "TELEGRAM_BOT_TOKEN not found in environment variables";
        return false;
    }

    readString(env, "VK_TOKEN", cfg.vk_token);
    readString(env, "VK_GROUP_ID", cfg.vk_group_id);
    if (!cfg.vk_group_id.empty() && !allDigits(cfg.vk_group_id)) {
        error = "VK_GROUP_ID must be numeric, got '" + cfg.vk_group_id + "'";
        return false;
    }
    readString(env, "VK_API_VERSION", cfg.vk_api_version);

    readString(env, "POSTSCHED_STORAGE", cfg.storage);
    if (cfg.storage != "postgres" && cfg.storage != "memory") {
        error = "POSTSCHED_STORAGE must be 'postgres' or 'memory', got '" + cfg.storage + "'";
        return false;
    }
    readString(env, "POSTSCHED_DB_HOST", cfg.db_host);
    readString(env, "POSTSCHED_DB_PORT", cfg.db_port);
    readString(env, "POSTSCHED_DB_NAME", cfg.db_name);
    readString(env, "POSTSCHED_DB_USER", cfg.db_user);
    readString(env, "POSTSCHED_DB_PASSWORD", cfg.db_password);

    auto tz = env.find("POSTSCHED_DEFAULT_TZ");
    if (tz != env.end() && !tz->second.empty()) {
        if (parseOffset(tz->second, cfg.default_tz_offset_minutes) != Error::None) {
            error = "POSTSCHED_DEFAULT_TZ must look like +HH:MM within +-14:00, got '" + tz->second + "'";
            return false;
        }
    }

    if (!readInt(env, "POSTSCHED_DISPATCH_INTERVAL_SECONDS", 1, 3600, cfg.dispatch_interval_seconds, error) ||
        !readInt(env, "POSTSCHED_REGISTRATION_QUEUE_CAP", 1, 10000, cfg.registration_queue_cap, error) ||
        !readInt(env, "POSTSCHED_PLATFORM_TIMEOUT_SECONDS", 1, 120, cfg.platform_timeout_seconds, error) ||
        !readInt(env, "POSTSCHED_POLL_TIMEOUT_SECONDS", 1, 50, cfg.poll_timeout_seconds, error)) {
        return false;
    }

    readString(env, "POSTSCHED_LOG_FILE", cfg.log_file);
    auto level = env.find("POSTSCHED_LOG_LEVEL");
    if (level != env.end() && !level->second.empty() && !parseLogLevel(level->second, cfg.log_level)) {
        error = "POSTSCHED_LOG_LEVEL must be debug, info, warning or error, got '" + level->second + "'";
        return false;
    }

    out = cfg;
    return true;
}

bool Config::fromEnvironment(Config& out, std::string& error) {
    std::map<std::string, std::string> env;
    for (const char* key : kKnownKeys) {
        const char* value = std::getenv(key);
        if (value) env[key] = value;
    }
    return fromMap(env, out, error);
}

} // namespace postsched

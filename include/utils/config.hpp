#ifndef POSTSCHED_CONFIG_HPP
#define POSTSCHED_CONFIG_HPP

#include <map>
#include <string>
#include "logger.hpp"

namespace postsched {

struct Config {
    std::string telegram_token;
    std::string vk_token;
    std::string vk_group_id;
    std::string vk_api_version = "5.199";

    std::string storage = "postgres";  // "postgres" | "memory"
    std::string db_host = "localhost";
    std::string db_port = "5432";
    std::string db_name = "postsched";
    std::string db_user = "postsched";
    std::string db_password = "postsched";

    int default_tz_offset_minutes = 0;
    int dispatch_interval_seconds = 30;
    int registration_queue_cap = 20;
    int platform_timeout_seconds = 15;
    int poll_timeout_seconds = 25;

    std::string log_file;
    LogLevel log_level = LogLevel::INFO;

    bool vkEnabled() const { return !vk_token.empty(); }

    // Builds a validated config from variable name -> value pairs. Missing keys
    // take their defaults; present but invalid values fail with a message.
    static bool fromMap(const std::map<std::string, std::string>& env, Config& out, std::string& error);
    static bool fromEnvironment(Config& out, std::string& error);
};

} // namespace postsched

#endif // POSTSCHED_CONFIG_HPP

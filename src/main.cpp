#include "auth/access_control.hpp"
#include "bot/command_router.hpp"
#include "bot/update_handler.hpp"
#include "channels/channel_registry.hpp"
#include "database/db_manager.hpp"
#include "platform/bot_api_client.hpp"
#include "scheduler/dispatcher.hpp"
#include "scheduler/recurring_task.hpp"
#include "scheduler/schedule_service.hpp"
#include "storage/in_memory_storage.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void signalHandler(int) {
    g_stop = true;
}

} // namespace

int main() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    postsched::Config config;
    std::string config_error;
    if (!postsched::Config::fromEnvironment(config, config_error)) {
        postsched::Logger::getInstance().error("Invalid configuration: " + config_error);
        return 1;
    }

    postsched::Logger& log = postsched::Logger::getInstance();
    log.setMinLevel(config.log_level);
    if (!config.log_file.empty() && !log.setLogFile(config.log_file)) {
        log.warning("Cannot open log file " + config.log_file + ", logging to console only");
    }
    log.info("Starting postsched...");

    // The bot front end and the dispatcher run on different threads; with
    // PostgreSQL each gets its own connection.
    std::unique_ptr<postsched::InMemoryStorage> memory;
    std::unique_ptr<postsched::DatabaseManager> front_db;
    std::unique_ptr<postsched::DatabaseManager> dispatch_db;
    postsched::UserStore* users = nullptr;
    postsched::ChannelStore* channel_store = nullptr;
    postsched::ScheduleStore* front_posts = nullptr;
    postsched::ScheduleStore* dispatch_posts = nullptr;

    if (config.storage == "memory") {
        log.warning("Using in-memory storage, nothing survives a restart");
        memory = std::make_unique<postsched::InMemoryStorage>();
        users = memory.get();
        channel_store = memory.get();
        front_posts = memory.get();
        dispatch_posts = memory.get();
    } else {
        front_db = std::make_unique<postsched::DatabaseManager>(
            config.db_host, config.db_port, config.db_name, config.db_user, config.db_password);
        dispatch_db = std::make_unique<postsched::DatabaseManager>(
            config.db_host, config.db_port, config.db_name, config.db_user, config.db_password);
        if (!front_db->initialize() || !dispatch_db->initialize()) {
            log.error("Failed to initialize database");
            return 1;
        }
        users = front_db.get();
        channel_store = front_db.get();
        front_posts = front_db.get();
        dispatch_posts = dispatch_db.get();
    }

    postsched::BotApiSettings settings;
    settings.telegram_token = config.telegram_token;
    settings.vk_token = config.vk_token;
    settings.vk_group_id = config.vk_group_id;
    settings.vk_api_version = config.vk_api_version;
    settings.timeout_seconds = config.platform_timeout_seconds;
    postsched::BotApiClient client(settings);

    postsched::ChannelRegistry registry(*channel_store, client);
    postsched::AccessControl access(*users, config.registration_queue_cap, config.default_tz_offset_minutes);
    postsched::ScheduleService schedule(*front_posts, access, registry);
    postsched::Dispatcher dispatcher(*dispatch_posts, client);

    postsched::RecurringTask dispatch_task(
        "Dispatcher",
        std::chrono::seconds(config.dispatch_interval_seconds),
        [&dispatcher]() { dispatcher.runOnce(); });

    postsched::CommandRouter router(access, registry, schedule, config.vkEnabled(),
                                    [&dispatch_task]() { dispatch_task.trigger(); });
    postsched::UpdateHandler updates(client, router, registry);

    const int poll_timeout = config.poll_timeout_seconds;
    postsched::RecurringTask poll_task(
        "Update poller",
        std::chrono::seconds(1),
        [&updates, poll_timeout]() {
            // Drain while updates keep arriving; back off for one interval on failure.
            while (!g_stop && updates.pollOnce(poll_timeout)) {
            }
        });

    if (config.vkEnabled()) {
        std::vector<postsched::ChannelTarget> groups;
        std::string error;
        if (!registry.refresh(postsched::Platform::Vk, groups, error)) {
            log.warning("Initial VK group refresh failed: " + error);
        }
    }

    dispatch_task.start();
    poll_task.start();
    log.info("postsched is running (dispatch every " + std::to_string(config.dispatch_interval_seconds) + "s)");

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log.info("Shutting down...");
    poll_task.stop();
    dispatch_task.stop();
    log.info("Stopped");
    return 0;
}

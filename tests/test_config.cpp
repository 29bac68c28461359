#include <QtTest/QtTest>

#include "utils/config.hpp"

using namespace postsched;

namespace {

std::map<std::string, std::string> minimal() {
    return {{"TELEGRAM_BOT_TOKEN", "123:abc"}};
}

} // namespace

class ConfigTests : public QObject {
    Q_OBJECT

private slots:
    void defaults();
    void missingTokenFails();
    void readsOverrides();
    void rejectsOutOfRangeNumbers();
    void pollTimeoutMustWait();
    void rejectsBadTimezone();
    void rejectsUnknownStorage();
    void rejectsBadLogLevel();
    void rejectsNonNumericGroup();
};

void ConfigTests::defaults() {
    Config cfg;
    std::string error;
    QVERIFY(Config::fromMap(minimal(), cfg, error));
    QCOMPARE(QString::fromStdString(cfg.telegram_token), QString("123:abc"));
    QCOMPARE(QString::fromStdString(cfg.storage), QString("postgres"));
    QCOMPARE(cfg.default_tz_offset_minutes, 0);
    QCOMPARE(cfg.dispatch_interval_seconds, 30);
    QCOMPARE(cfg.registration_queue_cap, 20);
    QCOMPARE(cfg.platform_timeout_seconds, 15);
    QVERIFY(cfg.log_level == LogLevel::INFO);
    QVERIFY(!cfg.vkEnabled());
}

void ConfigTests::missingTokenFails() {
    Config cfg;
    std::string error;
    QVERIFY(!Config::fromMap({}, cfg, error));
    QVERIFY(error.find("TELEGRAM_BOT_TOKEN") != std::string::npos);

    QVERIFY(!Config::fromMap({{"TELEGRAM_BOT_TOKEN", ""}}, cfg, error));
}

void ConfigTests::readsOverrides() {
    auto env = minimal();
    env["VK_TOKEN"] = "vk1.a.token";
    env["VK_GROUP_ID"] = "224466";
    env["POSTSCHED_STORAGE"] = "memory";
    env["POSTSCHED_DEFAULT_TZ"] = "+03:00";
    env["POSTSCHED_DISPATCH_INTERVAL_SECONDS"] = "5";
    env["POSTSCHED_REGISTRATION_QUEUE_CAP"] = "3";
    env["POSTSCHED_LOG_LEVEL"] = "DEBUG";

    Config cfg;
    std::string error;
    QVERIFY(Config::fromMap(env, cfg, error));
    QVERIFY(cfg.vkEnabled());
    QCOMPARE(QString::fromStdString(cfg.vk_group_id), QString("224466"));
    QCOMPARE(QString::fromStdString(cfg.storage), QString("memory"));
    QCOMPARE(cfg.default_tz_offset_minutes, 180);
    QCOMPARE(cfg.dispatch_interval_seconds, 5);
    QCOMPARE(cfg.registration_queue_cap, 3);
    QVERIFY(cfg.log_level == LogLevel::DEBUG);
}

void ConfigTests::rejectsOutOfRangeNumbers() {
    const char* const bad[] = {"0", "-5", "abc", "99999999999", "3601"};
    for (const char* value : bad) {
        auto env = minimal();
        env["POSTSCHED_DISPATCH_INTERVAL_SECONDS"] = value;
        Config cfg;
        std::string error;
        QVERIFY2(!Config::fromMap(env, cfg, error), value);
        QVERIFY(error.find("POSTSCHED_DISPATCH_INTERVAL_SECONDS") != std::string::npos);
    }

    auto env = minimal();
    env["POSTSCHED_REGISTRATION_QUEUE_CAP"] = "0";
    Config cfg;
    std::string error;
    QVERIFY(!Config::fromMap(env, cfg, error));
}

void ConfigTests::pollTimeoutMustWait() {
    auto env = minimal();
    env["POSTSCHED_POLL_TIMEOUT_SECONDS"] = "0";
    Config cfg;
    std::string error;
    // A zero long-poll timeout would spin the update loop.
    QVERIFY(!Config::fromMap(env, cfg, error));
    QVERIFY(error.find("POSTSCHED_POLL_TIMEOUT_SECONDS") != std::string::npos);

    env["POSTSCHED_POLL_TIMEOUT_SECONDS"] = "51";
    QVERIFY(!Config::fromMap(env, cfg, error));

    env["POSTSCHED_POLL_TIMEOUT_SECONDS"] = "1";
    QVERIFY(Config::fromMap(env, cfg, error));
    QCOMPARE(cfg.poll_timeout_seconds, 1);
}

void ConfigTests::rejectsBadTimezone() {
    auto env = minimal();
    env["POSTSCHED_DEFAULT_TZ"] = "+15:00";
    Config cfg;
    std::string error;
    QVERIFY(!Config::fromMap(env, cfg, error));
    QVERIFY(error.find("POSTSCHED_DEFAULT_TZ") != std::string::npos);
}

void ConfigTests::rejectsUnknownStorage() {
    auto env = minimal();
    env["POSTSCHED_STORAGE"] = "sqlite";
    Config cfg;
    std::string error;
    QVERIFY(!Config::fromMap(env, cfg, error));
    QVERIFY(error.find("sqlite") != std::string::npos);
}

void ConfigTests::rejectsBadLogLevel() {
    auto env = minimal();
    env["POSTSCHED_LOG_LEVEL"] = "verbose";
    Config cfg;
    std::string error;
    QVERIFY(!Config::fromMap(env, cfg, error));
}

void ConfigTests::rejectsNonNumericGroup() {
    auto env = minimal();
    env["VK_GROUP_ID"] = "club123";
    Config cfg;
    std::string error;
    QVERIFY(!Config::fromMap(env, cfg, error));
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"

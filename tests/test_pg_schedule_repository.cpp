#include <QtTest/QtTest>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "database/db_manager.hpp"

using namespace postsched;

// Runs against a live PostgreSQL only when POSTSCHED_TEST_PG is set. The
// connection comes from the same POSTSCHED_DB_* variables the service reads.

namespace {

std::string envOr(const char* key, const char* fallback) {
    const QByteArray value = qgetenv(key);
    return value.isEmpty() ? std::string(fallback) : value.toStdString();
}

std::unique_ptr<DatabaseManager> connect() {
    std::unique_ptr<DatabaseManager> db(new DatabaseManager(
        envOr("POSTSCHED_DB_HOST", "localhost"),
        envOr("POSTSCHED_DB_PORT", "5432"),
        envOr("POSTSCHED_DB_NAME", "postsched"),
        envOr("POSTSCHED_DB_USER", "postsched"),
        envOr("POSTSCHED_DB_PASSWORD", "postsched")));
    if (!db->initialize()) return nullptr;
    return db;
}

ScheduledPost makePost(std::vector<int64_t> channels = {-100}) {
    ScheduledPost post;
    post.owner_id = 777000;
    post.source.chat_id = 500;
    post.source.message_id = 7;
    post.source.caption = "hello";
    post.source.photo_file_id = "AgACphoto";
    post.requested_local = "12:00";
    // Far future, so a running service never picks these up.
    post.dispatch_at = 4102444800;
    post.created_at = 1000;
    for (int64_t id : channels) {
        TargetResult t;
        t.target.platform = Platform::Telegram;
        t.target.external_id = id;
        t.target.title = "Chan " + std::to_string(id);
        post.targets.push_back(t);
    }
    return post;
}

} // namespace

class PgScheduleRepositoryTests : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void createRoundTrips();
    void transitionIsCompareAndSwap();
    void terminalStatesAreFinal();
    void concurrentClaimsAcrossConnections();

private:
    std::unique_ptr<DatabaseManager> db_;
};

void PgScheduleRepositoryTests::initTestCase() {
    if (qgetenv("POSTSCHED_TEST_PG").isEmpty()) {
        QSKIP("POSTSCHED_TEST_PG is not set");
    }
    db_ = connect();
    QVERIFY2(db_ != nullptr, "cannot connect to PostgreSQL");
}

void PgScheduleRepositoryTests::createRoundTrips() {
    ScheduledPost p = makePost({-100, -200});
    QVERIFY(db_->createPost(p) == Error::None);
    QVERIFY(p.id > 0);

    ScheduledPost loaded;
    QVERIFY(db_->getPost(p.id, loaded) == Error::None);
    QVERIFY(loaded.state == PostState::Scheduled);
    QVERIFY(loaded.source.chat_id == 500);
    QCOMPARE(QString::fromStdString(loaded.source.caption), QString("hello"));
    QCOMPARE(QString::fromStdString(loaded.source.photo_file_id), QString("AgACphoto"));
    QCOMPARE(static_cast<int>(loaded.targets.size()), 2);
    QVERIFY(loaded.targets[0].target.external_id == -100);
    QVERIFY(loaded.targets[1].target.external_id == -200);
}

void PgScheduleRepositoryTests::transitionIsCompareAndSwap() {
    ScheduledPost p = makePost();
    QVERIFY(db_->createPost(p) == Error::None);

    QVERIFY(db_->transition(p.id, PostState::Dispatching, PostState::Sent, {}) == Error::StateConflict);
    QVERIFY(db_->transition(p.id, PostState::Scheduled, PostState::Dispatching, {}) == Error::None);
    QVERIFY(db_->transition(p.id, PostState::Scheduled, PostState::Dispatching, {}) == Error::StateConflict);
    QVERIFY(db_->transition(p.id, PostState::Dispatching, PostState::Scheduled, {}) == Error::InvalidState);
    QVERIFY(db_->cancel(p.id) == Error::InvalidState);

    std::vector<TargetResult> results = p.targets;
    results[0].outcome = TargetOutcome::Sent;
    results[0].method = DeliveryMethod::Copy;
    results[0].message_ref = "42";
    QVERIFY(db_->transition(p.id, PostState::Dispatching, PostState::Sent, results) == Error::None);

    ScheduledPost loaded;
    QVERIFY(db_->getPost(p.id, loaded) == Error::None);
    QVERIFY(loaded.state == PostState::Sent);
    QVERIFY(loaded.targets[0].method == DeliveryMethod::Copy);
    QCOMPARE(QString::fromStdString(loaded.targets[0].message_ref), QString("42"));
}

void PgScheduleRepositoryTests::terminalStatesAreFinal() {
    ScheduledPost p = makePost();
    QVERIFY(db_->createPost(p) == Error::None);
    QVERIFY(db_->cancel(p.id) == Error::None);

    const PostState targets[] = {PostState::Scheduled, PostState::Dispatching, PostState::Sent,
                                 PostState::Failed};
    for (PostState to : targets) {
        QVERIFY(db_->transition(p.id, PostState::Cancelled, to, {}) == Error::InvalidState);
    }
    QVERIFY(db_->reschedule(p.id, 4102444900, "13:00", 0) == Error::InvalidState);
}

void PgScheduleRepositoryTests::concurrentClaimsAcrossConnections() {
    std::vector<int64_t> ids;
    for (int i = 0; i < 10; i++) {
        ScheduledPost p = makePost();
        QVERIFY(db_->createPost(p) == Error::None);
        ids.push_back(p.id);
    }

    constexpr int kWorkers = 4;
    std::vector<std::unique_ptr<DatabaseManager>> connections;
    for (int w = 0; w < kWorkers; w++) {
        connections.push_back(connect());
        QVERIFY(connections.back() != nullptr);
    }

    std::atomic<int> won{0};
    std::atomic<int> conflicts{0};
    std::atomic<int> other{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < kWorkers; w++) {
        DatabaseManager* db = connections[w].get();
        workers.emplace_back([&, db]() {
            for (int64_t id : ids) {
                const Error err = db->transition(id, PostState::Scheduled, PostState::Dispatching, {});
                if (err == Error::None) {
                    won++;
                } else if (err == Error::StateConflict) {
                    conflicts++;
                } else {
                    other++;
                }
            }
        });
    }
    for (auto& t : workers) t.join();

    QCOMPARE(won.load(), 10);
    QCOMPARE(conflicts.load(), 10 * (kWorkers - 1));
    QCOMPARE(other.load(), 0);
}

QTEST_MAIN(PgScheduleRepositoryTests)
#include "test_pg_schedule_repository.moc"

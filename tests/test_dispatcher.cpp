#include <QtTest/QtTest>

#include <future>
#include <thread>

#include "fake_platform_client.hpp"
#include "scheduler/dispatcher.hpp"
#include "storage/in_memory_storage.hpp"

using namespace postsched;

namespace {

constexpr UnixTime kNow = 5000;

ChannelTarget telegram(int64_t id) {
    ChannelTarget t;
    t.platform = Platform::Telegram;
    t.external_id = id;
    t.title = "Chan " + std::to_string(id);
    return t;
}

ChannelTarget vk(int64_t id) {
    ChannelTarget t;
    t.platform = Platform::Vk;
    t.external_id = id;
    t.title = "Group " + std::to_string(id);
    return t;
}

int64_t schedule(InMemoryStorage& store, std::vector<ChannelTarget> targets, UnixTime at = kNow - 10) {
    ScheduledPost post;
    post.owner_id = 1;
    post.source.chat_id = 500;
    post.source.message_id = 7;
    post.source.caption = "Announcement";
    post.requested_local = "now";
    post.dispatch_at = at;
    for (const auto& t : targets) {
        TargetResult r;
        r.target = t;
        post.targets.push_back(r);
    }
    if (store.createPost(post) != Error::None) return 0;
    return post.id;
}

ScheduledPost load(InMemoryStorage& store, int64_t id) {
    ScheduledPost post;
    if (store.getPost(id, post) != Error::None) post.id = 0;
    return post;
}

Dispatcher::Clock fixedClock() {
    return []() { return kNow; };
}

// Another worker claims every due post between listing and claiming.
class RacingStore : public InMemoryStorage {
public:
    Error listDue(UnixTime now, std::vector<ScheduledPost>& out) override {
        const Error err = InMemoryStorage::listDue(now, out);
        if (err != Error::None) return err;
        for (const auto& p : out) {
            if (transition(p.id, PostState::Scheduled, PostState::Dispatching, {}) != Error::None) {
                return Error::StorageUnavailable;
            }
        }
        return Error::None;
    }
};

class BrokenStore : public InMemoryStorage {
public:
    Error listDue(UnixTime, std::vector<ScheduledPost>&) override {
        return Error::StorageUnavailable;
    }
};

// Holds the first forward until released.
class BlockingClient : public FakePlatformClient {
public:
    std::promise<void> entered;
    std::shared_future<void> release;

    DeliveryResult forward(const SourceRef& source, const ChannelTarget& target) override {
        entered.set_value();
        release.wait();
        return FakePlatformClient::forward(source, target);
    }
};

} // namespace

class DispatcherTests : public QObject {
    Q_OBJECT

private slots:
    void forwardSuccess();
    void notMemberFallsBackToCopy();
    void transientFailsWithoutCopy();
    void copyFailureMarksFailed();
    void vkTargetsGetWallPost();
    void vkPhotoIsPassedToWallPost();
    void partialFailureKeepsDetail();
    void futurePostsUntouched();
    void failedPostsAreNotRetried();
    void claimedElsewhereIsSkipped();
    void listingFailureAbortsTick();
    void overlappingTickIsSkipped();
};

void DispatcherTests::forwardSuccess() {
    InMemoryStorage store;
    FakePlatformClient client;
    const int64_t id = schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.due, 1);
    QCOMPARE(report.claimed, 1);
    QCOMPARE(report.sent, 1);
    QCOMPARE(report.failed, 0);

    const ScheduledPost post = load(store, id);
    QVERIFY(post.state == PostState::Sent);
    QVERIFY(post.targets[0].outcome == TargetOutcome::Sent);
    QVERIFY(post.targets[0].method == DeliveryMethod::Forward);
    QCOMPARE(QString::fromStdString(post.targets[0].message_ref), QString("forward--100"));
}

void DispatcherTests::notMemberFallsBackToCopy() {
    InMemoryStorage store;
    FakePlatformClient client;
    client.forward_results[-100] = DeliveryResult::failure(DeliveryError::NotMember, "chat not found");
    const int64_t id = schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.sent, 1);
    QCOMPARE(client.count("forward"), 1);
    QCOMPARE(client.count("copy"), 1);

    const ScheduledPost post = load(store, id);
    QVERIFY(post.state == PostState::Sent);
    QVERIFY(post.targets[0].method == DeliveryMethod::Copy);
    QVERIFY(post.targets[0].error == DeliveryError::None);
}

void DispatcherTests::transientFailsWithoutCopy() {
    InMemoryStorage store;
    FakePlatformClient client;
    client.forward_results[-100] = DeliveryResult::failure(DeliveryError::Transient, "timeout");
    const int64_t id = schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.failed, 1);
    QCOMPARE(client.count("copy"), 0);

    const ScheduledPost post = load(store, id);
    QVERIFY(post.state == PostState::Failed);
    QVERIFY(post.targets[0].outcome == TargetOutcome::Failed);
    QVERIFY(post.targets[0].error == DeliveryError::Transient);
    QCOMPARE(QString::fromStdString(post.targets[0].error_text), QString("timeout"));
}

void DispatcherTests::copyFailureMarksFailed() {
    InMemoryStorage store;
    FakePlatformClient client;
    client.forward_results[-100] = DeliveryResult::failure(DeliveryError::NotMember, "message to forward not found");
    client.copy_results[-100] = DeliveryResult::failure(DeliveryError::Other, "Bad Request: message can't be copied");
    const int64_t id = schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    dispatcher.runOnce();
    QCOMPARE(client.count("copy"), 1);
    const ScheduledPost post = load(store, id);
    QVERIFY(post.state == PostState::Failed);
    QVERIFY(post.targets[0].method == DeliveryMethod::Copy);
    QVERIFY(post.targets[0].error == DeliveryError::Other);
}

void DispatcherTests::vkTargetsGetWallPost() {
    InMemoryStorage store;
    FakePlatformClient client;
    const int64_t id = schedule(store, {vk(123)});
    Dispatcher dispatcher(store, client, fixedClock());

    dispatcher.runOnce();
    QCOMPARE(client.count("post"), 1);
    QCOMPARE(client.count("forward"), 0);
    QCOMPARE(QString::fromStdString(client.last_caption), QString("Announcement"));

    const ScheduledPost post = load(store, id);
    QVERIFY(post.state == PostState::Sent);
    QVERIFY(post.targets[0].method == DeliveryMethod::Post);
}

void DispatcherTests::vkPhotoIsPassedToWallPost() {
    InMemoryStorage store;
    FakePlatformClient client;
    ScheduledPost post;
    post.owner_id = 1;
    post.source.chat_id = 500;
    post.source.message_id = 8;
    post.source.photo_file_id = "AgACphoto";
    post.dispatch_at = kNow - 1;
    TargetResult tg;
    tg.target = telegram(-100);
    TargetResult wall;
    wall.target = vk(123);
    post.targets = {tg, wall};
    QVERIFY(store.createPost(post) == Error::None);
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.sent, 1);
    QCOMPARE(client.count("post"), 1);
    QCOMPARE(client.count("forward"), 1);
    QCOMPARE(QString::fromStdString(client.last_photo), QString("AgACphoto"));
    QVERIFY(client.last_caption.empty());
    QVERIFY(load(store, post.id).targets[1].outcome == TargetOutcome::Sent);
}

void DispatcherTests::partialFailureKeepsDetail() {
    InMemoryStorage store;
    FakePlatformClient client;
    client.post_results[123] = DeliveryResult::failure(DeliveryError::RateLimited, "wall.post: 9 Flood control");
    const int64_t id = schedule(store, {telegram(-100), vk(123), telegram(-200)});
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.failed, 1);
    // One failing target does not stop the others.
    QCOMPARE(client.count("forward"), 2);

    const ScheduledPost post = load(store, id);
    QVERIFY(post.state == PostState::Failed);
    QVERIFY(post.targets[0].outcome == TargetOutcome::Sent);
    QVERIFY(post.targets[1].outcome == TargetOutcome::Failed);
    QVERIFY(post.targets[1].error == DeliveryError::RateLimited);
    QVERIFY(post.targets[2].outcome == TargetOutcome::Sent);
}

void DispatcherTests::futurePostsUntouched() {
    InMemoryStorage store;
    FakePlatformClient client;
    const int64_t id = schedule(store, {telegram(-100)}, kNow + 60);
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.due, 0);
    QVERIFY(client.calls.empty());
    QVERIFY(load(store, id).state == PostState::Scheduled);
}

void DispatcherTests::failedPostsAreNotRetried() {
    InMemoryStorage store;
    FakePlatformClient client;
    client.forward_results[-100] = DeliveryResult::failure(DeliveryError::RateLimited, "Too Many Requests");
    schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    dispatcher.runOnce();
    const TickReport second = dispatcher.runOnce();
    QCOMPARE(second.due, 0);
    QCOMPARE(client.count("forward"), 1);
}

void DispatcherTests::claimedElsewhereIsSkipped() {
    RacingStore store;
    FakePlatformClient client;
    const int64_t id = schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QCOMPARE(report.due, 1);
    QCOMPARE(report.claimed, 0);
    QCOMPARE(report.skipped, 1);
    QVERIFY(client.calls.empty());
    QVERIFY(load(store, id).state == PostState::Dispatching);
}

void DispatcherTests::listingFailureAbortsTick() {
    BrokenStore store;
    FakePlatformClient client;
    Dispatcher dispatcher(store, client, fixedClock());

    const TickReport report = dispatcher.runOnce();
    QVERIFY(report.aborted);
    QCOMPARE(report.due, 0);
    QVERIFY(client.calls.empty());
}

void DispatcherTests::overlappingTickIsSkipped() {
    InMemoryStorage store;
    BlockingClient client;
    std::promise<void> release;
    client.release = release.get_future().share();
    std::future<void> entered = client.entered.get_future();
    const int64_t id = schedule(store, {telegram(-100)});
    Dispatcher dispatcher(store, client, fixedClock());

    TickReport first;
    std::thread runner([&]() { first = dispatcher.runOnce(); });
    entered.wait();

    const TickReport second = dispatcher.runOnce();
    QVERIFY(second.skipped_overlap);
    QCOMPARE(second.due, 0);

    release.set_value();
    runner.join();
    QCOMPARE(first.sent, 1);
    QVERIFY(load(store, id).state == PostState::Sent);
}

QTEST_MAIN(DispatcherTests)
#include "test_dispatcher.moc"

#include <QtTest/QtTest>

#include "channels/channel_registry.hpp"
#include "fake_platform_client.hpp"
#include "storage/in_memory_storage.hpp"

using namespace postsched;

namespace {

ChannelTarget vkGroup(int64_t id, const std::string& title) {
    ChannelTarget t;
    t.platform = Platform::Vk;
    t.external_id = id;
    t.title = title;
    return t;
}

} // namespace

class ChannelRegistryTests : public QObject {
    Q_OBJECT

private slots:
    void adminStatusRegistersChannel();
    void otherStatusesAreIgnored();
    void titleUpdatesInPlace();
    void listIsOrderedByTitle();
    void vkRefreshReplacesSet();
    void failedVkRefreshKeepsSet();
    void telegramRefreshListsStored();
    void removeDeletesTarget();
};

void ChannelRegistryTests::adminStatusRegistersChannel() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);

    QVERIFY(registry.handleMemberStatus(-100, "News", "administrator") == Error::None);
    QVERIFY(registry.handleMemberStatus(-200, "Mine", "creator") == Error::None);

    ChannelTarget found;
    QVERIFY(registry.find(Platform::Telegram, -100, found) == Error::None);
    QCOMPARE(QString::fromStdString(found.title), QString("News"));
    QVERIFY(found.can_post);
    QVERIFY(registry.find(Platform::Telegram, -200, found) == Error::None);
    QVERIFY(registry.find(Platform::Vk, -100, found) == Error::NotFound);
}

void ChannelRegistryTests::otherStatusesAreIgnored() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);

    QVERIFY(registry.handleMemberStatus(-100, "News", "member") == Error::None);
    std::vector<ChannelTarget> out;
    QVERIFY(registry.list(Platform::Telegram, out) == Error::None);
    QVERIFY(out.empty());

    // Leaving a channel keeps the stored entry.
    QVERIFY(registry.handleMemberStatus(-100, "News", "administrator") == Error::None);
    QVERIFY(registry.handleMemberStatus(-100, "News", "left") == Error::None);
    QVERIFY(registry.list(Platform::Telegram, out) == Error::None);
    QCOMPARE(static_cast<int>(out.size()), 1);
}

void ChannelRegistryTests::titleUpdatesInPlace() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);

    QVERIFY(registry.handleMemberStatus(-100, "Old", "administrator") == Error::None);
    QVERIFY(registry.handleMemberStatus(-100, "New", "administrator") == Error::None);

    std::vector<ChannelTarget> out;
    QVERIFY(registry.list(Platform::Telegram, out) == Error::None);
    QCOMPARE(static_cast<int>(out.size()), 1);
    QCOMPARE(QString::fromStdString(out[0].title), QString("New"));
}

void ChannelRegistryTests::listIsOrderedByTitle() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);

    QVERIFY(registry.handleMemberStatus(-300, "Zeta", "administrator") == Error::None);
    QVERIFY(registry.handleMemberStatus(-100, "Alpha", "administrator") == Error::None);
    QVERIFY(registry.handleMemberStatus(-200, "Alpha", "administrator") == Error::None);

    std::vector<ChannelTarget> out;
    QVERIFY(registry.list(Platform::Telegram, out) == Error::None);
    QCOMPARE(static_cast<int>(out.size()), 3);
    QVERIFY(out[0].external_id == -200);
    QVERIFY(out[1].external_id == -100);
    QVERIFY(out[2].external_id == -300);
}

void ChannelRegistryTests::vkRefreshReplacesSet() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);
    QVERIFY(registry.upsertFromEvent(vkGroup(1, "Gone")) == Error::None);

    client.vk_groups = {vkGroup(20, "Second"), vkGroup(10, "First")};
    std::vector<ChannelTarget> out;
    std::string error;
    QVERIFY(registry.refresh(Platform::Vk, out, error));
    QCOMPARE(static_cast<int>(out.size()), 2);
    QVERIFY(out[0].external_id == 10);
    QVERIFY(out[1].external_id == 20);

    ChannelTarget found;
    QVERIFY(registry.find(Platform::Vk, 1, found) == Error::NotFound);
}

void ChannelRegistryTests::failedVkRefreshKeepsSet() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);
    QVERIFY(registry.upsertFromEvent(vkGroup(1, "Kept")) == Error::None);

    client.vk_fails = true;
    std::vector<ChannelTarget> out;
    std::string error;
    QVERIFY(!registry.refresh(Platform::Vk, out, error));
    QVERIFY(!error.empty());

    QVERIFY(registry.list(Platform::Vk, out) == Error::None);
    QCOMPARE(static_cast<int>(out.size()), 1);
    QCOMPARE(QString::fromStdString(out[0].title), QString("Kept"));
}

void ChannelRegistryTests::telegramRefreshListsStored() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);
    QVERIFY(registry.handleMemberStatus(-100, "News", "administrator") == Error::None);

    std::vector<ChannelTarget> out;
    std::string error;
    QVERIFY(registry.refresh(Platform::Telegram, out, error));
    QCOMPARE(static_cast<int>(out.size()), 1);
    QVERIFY(out[0].external_id == -100);
}

void ChannelRegistryTests::removeDeletesTarget() {
    InMemoryStorage store;
    FakePlatformClient client;
    ChannelRegistry registry(store, client);
    QVERIFY(registry.handleMemberStatus(-100, "News", "administrator") == Error::None);

    QVERIFY(registry.remove(Platform::Telegram, -100) == Error::None);
    QVERIFY(registry.remove(Platform::Telegram, -100) == Error::NotFound);
    ChannelTarget found;
    QVERIFY(registry.find(Platform::Telegram, -100, found) == Error::NotFound);
}

QTEST_MAIN(ChannelRegistryTests)
#include "test_channel_registry.moc"

#include <QtTest/QtTest>

#include "bot/update_handler.hpp"
#include "fake_platform_client.hpp"
#include "storage/in_memory_storage.hpp"

using namespace postsched;

namespace {

Update textUpdate(int64_t update_id, int64_t user, const std::string& text) {
    Update u;
    u.update_id = update_id;
    u.kind = Update::Kind::Message;
    u.message.chat_id = user;
    u.message.from_id = user;
    u.message.message_id = update_id;
    u.message.text = text;
    return u;
}

struct Harness {
    InMemoryStorage store;
    FakePlatformClient client;
    AccessControl access{store, 5, 0};
    ChannelRegistry channels{store, client};
    ScheduleService schedule{store, access, channels};
    CommandRouter router{access, channels, schedule, false};
    UpdateHandler handler{client, router, channels};
};

} // namespace

class UpdateHandlerTests : public QObject {
    Q_OBJECT

private slots:
    void repliesToSender();
    void callbacksAreAnswered();
    void memberStatusRegistersChannel();
    void privateMemberStatusIgnored();
    void pollAdvancesOffset();
};

void UpdateHandlerTests::repliesToSender() {
    Harness h;
    h.handler.handle(textUpdate(1, 7, "/start"));
    QCOMPARE(static_cast<int>(h.client.sent.size()), 1);
    QVERIFY(h.client.sent[0].chat_id == 7);
    QCOMPARE(QString::fromStdString(h.client.sent[0].text), QString("You are superadmin"));
}

void UpdateHandlerTests::callbacksAreAnswered() {
    Harness h;
    h.handler.handle(textUpdate(1, 1, "/start"));
    h.handler.handle(textUpdate(2, 2, "/start"));

    Update press;
    press.update_id = 3;
    press.kind = Update::Kind::Callback;
    press.callback.id = "q1";
    press.callback.from_id = 1;
    press.callback.chat_id = 1;
    press.callback.data = "approve:2";
    h.handler.handle(press);

    QCOMPARE(static_cast<int>(h.client.answered.size()), 1);
    QCOMPARE(QString::fromStdString(h.client.answered[0]), QString("q1"));
    QCOMPARE(QString::fromStdString(h.client.sent.back().text), QString("User 2 approved"));
    QVERIFY(h.access.isAuthorized(2));
}

void UpdateHandlerTests::memberStatusRegistersChannel() {
    Harness h;
    Update u;
    u.update_id = 1;
    u.kind = Update::Kind::MemberStatus;
    u.member.chat_id = -100;
    u.member.chat_type = "channel";
    u.member.title = "News";
    u.member.status = "administrator";
    h.handler.handle(u);

    ChannelTarget found;
    QVERIFY(h.channels.find(Platform::Telegram, -100, found) == Error::None);
    QVERIFY(h.client.sent.empty());
}

void UpdateHandlerTests::privateMemberStatusIgnored() {
    Harness h;
    Update u;
    u.update_id = 1;
    u.kind = Update::Kind::MemberStatus;
    u.member.chat_id = 55;
    u.member.chat_type = "private";
    u.member.status = "member";
    h.handler.handle(u);

    std::vector<ChannelTarget> out;
    QVERIFY(h.channels.list(Platform::Telegram, out) == Error::None);
    QVERIFY(out.empty());
}

void UpdateHandlerTests::pollAdvancesOffset() {
    Harness h;
    h.client.pending_updates = {textUpdate(10, 1, "/start"), textUpdate(11, 2, "/start")};

    QVERIFY(h.handler.pollOnce(0));
    QVERIFY(h.handler.offset() == 12);
    QCOMPARE(static_cast<int>(h.client.sent.size()), 2);

    // Already handled updates are not fetched again.
    QVERIFY(h.handler.pollOnce(0));
    QVERIFY(h.client.last_offset == 12);
    QCOMPARE(static_cast<int>(h.client.sent.size()), 2);
}

QTEST_MAIN(UpdateHandlerTests)
#include "test_update_handler.moc"

#include <QtTest/QtTest>

#include "platform/error_classifier.hpp"

using namespace postsched;

class ErrorClassifierTests : public QObject {
    Q_OBJECT

private slots:
    void telegramRateLimit();
    void telegramTransport();
    void telegramMembership();
    void telegramOther();
    void vkCodes();
};

void ErrorClassifierTests::telegramRateLimit() {
    QVERIFY(classifyTelegramError(429, "Too Many Requests: retry after 5") == DeliveryError::RateLimited);
}

void ErrorClassifierTests::telegramTransport() {
    QVERIFY(classifyTelegramError(0, "Timeout was reached") == DeliveryError::Transient);
    QVERIFY(classifyTelegramError(502, "Bad Gateway") == DeliveryError::Transient);
}

void ErrorClassifierTests::telegramMembership() {
    QVERIFY(classifyTelegramError(400, "Bad Request: chat not found") == DeliveryError::NotMember);
    QVERIFY(classifyTelegramError(400, "Bad Request: message to forward not found") == DeliveryError::NotMember);
    QVERIFY(classifyTelegramError(403, "Forbidden: bot is not a member of the channel chat") ==
            DeliveryError::NotMember);
    QVERIFY(classifyTelegramError(400, "Bad Request: CHAT_FORWARDS_RESTRICTED") == DeliveryError::NotMember);
}

void ErrorClassifierTests::telegramOther() {
    QVERIFY(classifyTelegramError(400, "Bad Request: message text is empty") == DeliveryError::Other);
    QVERIFY(classifyTelegramError(401, "Unauthorized") == DeliveryError::Other);
}

void ErrorClassifierTests::vkCodes() {
    QVERIFY(classifyVkError(6) == DeliveryError::RateLimited);
    QVERIFY(classifyVkError(9) == DeliveryError::RateLimited);
    QVERIFY(classifyVkError(10) == DeliveryError::Transient);
    QVERIFY(classifyVkError(15) == DeliveryError::NotMember);
    QVERIFY(classifyVkError(214) == DeliveryError::NotMember);
    QVERIFY(classifyVkError(100) == DeliveryError::Other);
}

QTEST_MAIN(ErrorClassifierTests)
#include "test_error_classifier.moc"

#include <QtTest/QtTest>

#include "scheduler/timezone.hpp"

using namespace postsched;

namespace {

// 2026-10-19 11:55:00 UTC
constexpr UnixTime kNow = 1792410900;

UnixTime resolve(const std::string& text, int offset, UnixTime now, Error* error = nullptr) {
    LocalTime local;
    UnixTime instant = -1;
    Error err = parseLocalTime(text, local);
    if (err == Error::None) err = resolveDispatchInstant(local, offset, now, instant);
    if (error) *error = err;
    return instant;
}

} // namespace

class TimezoneTests : public QObject {
    Q_OBJECT

private slots:
    void timeOfDaySameDay();
    void timeOfDayRollsToNextDay();
    void singleDigitHour();
    void negativeOffsetAcrossDateLine();
    void fullDateResolvesExactly();
    void fullDateInPast();
    void immediate();
    void malformedTimes();
    void offsetParsing();
    void malformedOffsetsDoNotWrite();
    void offsetFormatting();
    void roundTripThroughLocal();
    void monotonicInTimeOfDay();
    void listingFormat();
};

void TimezoneTests::timeOfDaySameDay() {
    Error err = Error::None;
    const UnixTime instant = resolve("14:00", 120, kNow, &err);
    QVERIFY(err == Error::None);
    // 14:00 at +02:00 is 12:00 UTC, five minutes from now.
    QVERIFY(instant == 1792411200);
}

void TimezoneTests::timeOfDayRollsToNextDay() {
    Error err = Error::None;
    const UnixTime instant = resolve("09:30", 0, kNow, &err);
    QVERIFY(err == Error::None);
    QVERIFY(instant == 1792488600);  // 2026-10-20 09:30 UTC
}

void TimezoneTests::singleDigitHour() {
    Error err = Error::None;
    QVERIFY(resolve("9:05", 0, kNow, &err) == 1792487100);  // 2026-10-20 09:05 UTC
    QVERIFY(err == Error::None);
    QVERIFY(resolve("01.01.2027 1:30", 120, kNow, &err) == 1798759800);
    QVERIFY(err == Error::None);

    LocalTime local;
    QVERIFY(parseLocalTime("9:05", local) == Error::None);
    QCOMPARE(local.hour, 9);
    QCOMPARE(local.minute, 5);
}

void TimezoneTests::negativeOffsetAcrossDateLine() {
    // 2026-10-19 02:00 UTC is 21:00 on the 18th at -05:00.
    const UnixTime now = 1792375200;
    Error err = Error::None;
    const UnixTime instant = resolve("22:00", -300, now, &err);
    QVERIFY(err == Error::None);
    QVERIFY(instant == now + 3600);
}

void TimezoneTests::fullDateResolvesExactly() {
    Error err = Error::None;
    const UnixTime instant = resolve("01.01.2027 01:30", 120, kNow, &err);
    QVERIFY(err == Error::None);
    QVERIFY(instant == 1798759800);  // 2026-12-31 23:30 UTC
}

void TimezoneTests::fullDateInPast() {
    Error err = Error::None;
    resolve("19.10.2026 13:00", 120, kNow, &err);  // 11:00 UTC
    QVERIFY(err == Error::TimeInPast);

    resolve("29.02.2024 00:00", 0, kNow, &err);
    QVERIFY(err == Error::TimeInPast);
}

void TimezoneTests::immediate() {
    Error err = Error::None;
    QVERIFY(resolve("now", 180, kNow, &err) == kNow);
    QVERIFY(err == Error::None);
    QVERIFY(resolve(" NOW ", 0, kNow, &err) == kNow);
}

void TimezoneTests::malformedTimes() {
    const char* const bad[] = {"", "25:00", "14-00", "1400", "14:60", "9:5", "123:00", ":905", "31.02.2026 10:00",
                               "29.02.2025 00:00", "19.10.26 10:00", "tomorrow"};
    for (const char* text : bad) {
        Error err = Error::None;
        resolve(text, 0, kNow, &err);
        QVERIFY2(err == Error::InvalidTime, text);
    }
}

void TimezoneTests::offsetParsing() {
    int minutes = 0;
    QVERIFY(parseOffset("+03:00", minutes) == Error::None);
    QCOMPARE(minutes, 180);
    QVERIFY(parseOffset("-05:30", minutes) == Error::None);
    QCOMPARE(minutes, -330);
    QVERIFY(parseOffset("+14:00", minutes) == Error::None);
    QCOMPARE(minutes, 840);
    QVERIFY(parseOffset("-00:00", minutes) == Error::None);
    QCOMPARE(minutes, 0);
}

void TimezoneTests::malformedOffsetsDoNotWrite() {
    const char* const bad[] = {"+14:01", "-15:00", "03:00", "+3:00", "+03:60", "+0300", "abc", ""};
    for (const char* text : bad) {
        int minutes = 77;
        QVERIFY2(parseOffset(text, minutes) == Error::InvalidOffset, text);
        QCOMPARE(minutes, 77);
    }

    LocalTime local;
    QVERIFY(parseLocalTime("12:00", local) == Error::None);
    UnixTime instant = 5;
    QVERIFY(resolveDispatchInstant(local, 900, kNow, instant) == Error::InvalidOffset);
    QVERIFY(instant == 5);
}

void TimezoneTests::offsetFormatting() {
    QCOMPARE(QString::fromStdString(formatOffset(180)), QString("+03:00"));
    QCOMPARE(QString::fromStdString(formatOffset(-330)), QString("-05:30"));
    QCOMPARE(QString::fromStdString(formatOffset(0)), QString("+00:00"));
}

void TimezoneTests::roundTripThroughLocal() {
    const int offsets[] = {-720, -330, 0, 180, 345, 840};
    const char* const times[] = {"00:00", "06:15", "11:55", "12:00", "23:59"};
    for (int offset : offsets) {
        for (const char* text : times) {
            LocalTime requested;
            QVERIFY(parseLocalTime(text, requested) == Error::None);
            UnixTime instant = 0;
            QVERIFY(resolveDispatchInstant(requested, offset, kNow, instant) == Error::None);
            QVERIFY(instant >= kNow);
            QVERIFY(instant < kNow + 86400);

            const LocalTime back = toLocal(instant, offset);
            QCOMPARE(back.hour, requested.hour);
            QCOMPARE(back.minute, requested.minute);
        }
    }

    LocalTime dated;
    QVERIFY(parseLocalTime("01.01.2027 01:30", dated) == Error::None);
    UnixTime instant = 0;
    QVERIFY(resolveDispatchInstant(dated, 120, kNow, instant) == Error::None);
    const LocalTime back = toLocal(instant, 120);
    QCOMPARE(back.year, 2027);
    QCOMPARE(back.month, 1);
    QCOMPARE(back.day, 1);
    QCOMPARE(back.hour, 1);
    QCOMPARE(back.minute, 30);
}

void TimezoneTests::monotonicInTimeOfDay() {
    // All after 13:55 local (+02:00), so none roll over.
    const char* const ordered[] = {"14:00", "15:30", "18:45", "23:59"};
    UnixTime previous = 0;
    for (const char* text : ordered) {
        Error err = Error::None;
        const UnixTime instant = resolve(text, 120, kNow, &err);
        QVERIFY(err == Error::None);
        QVERIFY(instant > previous);
        previous = instant;
    }
}

void TimezoneTests::listingFormat() {
    QCOMPARE(QString::fromStdString(formatLocal(1792411200, 120)), QString("14:00 19.10.2026"));
    QCOMPARE(QString::fromStdString(formatLocal(1798759800, 0)), QString("23:30 31.12.2026"));
}

QTEST_MAIN(TimezoneTests)
#include "test_timezone.moc"

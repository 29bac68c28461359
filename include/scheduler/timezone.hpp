#ifndef POSTSCHED_TIMEZONE_HPP
#define POSTSCHED_TIMEZONE_HPP

#include <string>
#include "models.hpp"

namespace postsched {

// Largest accepted distance from UTC, in minutes (UTC+14:00 / UTC-14:00).
constexpr int kMaxOffsetMinutes = 14 * 60;

// A user supplied wall-clock time. Either "now", a time of day ("HH:MM") or a
// full local date-time ("DD.MM.YYYY HH:MM").
struct LocalTime {
    bool immediate = false;
    bool has_date = false;
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
};

UnixTime nowUtc();

// "+03:00", "-05:30". Anything else, or beyond +-14:00, is InvalidOffset.
Error parseOffset(const std::string& text, int& out_minutes);
std::string formatOffset(int offset_minutes);

Error parseLocalTime(const std::string& text, LocalTime& out);

// Turns a local time into the UTC instant it denotes for a user at the given
// offset. A bare time of day resolves to its next occurrence at or after now;
// a full date resolves exactly and must not lie before now.
Error resolveDispatchInstant(const LocalTime& local,
                             int offset_minutes,
                             UnixTime now_utc,
                             UnixTime& out_instant);

// Inverse of resolution: the wall-clock date and time of an instant.
LocalTime toLocal(UnixTime instant, int offset_minutes);

// "HH:MM DD.MM.YYYY" in the given offset.
std::string formatLocal(UnixTime instant, int offset_minutes);

} // namespace postsched

#endif // POSTSCHED_TIMEZONE_HPP

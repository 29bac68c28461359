#include "../../include/scheduler/timezone.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace postsched {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Howard Hinnant's civil calendar algorithms (proleptic Gregorian).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t year = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(year + (m <= 2));
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) return 29;
    return kDays[m - 1];
}

bool parseDigits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; i++) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

// "HH:MM" or "H:MM", hour 0-23.
bool parseClock(const std::string& s, int& hour, int& minute) {
    const size_t colon = s.find(':');
    if ((colon != 1 && colon != 2) || s.size() != colon + 3) return false;
    if (!parseDigits(s, 0, colon, hour) || !parseDigits(s, colon + 1, 2, minute)) return false;
    return hour <= 23 && minute <= 59;
}

// "DD.MM.YYYY"
bool parseDate(const std::string& s, int& year, int& month, int& day) {
    if (s.size() != 10 || s[2] != '.' || s[5] != '.') return false;
    if (!parseDigits(s, 0, 2, day) || !parseDigits(s, 3, 2, month) || !parseDigits(s, 6, 4, year)) {
        return false;
    }
    if (year < 1970 || month < 1 || month > 12 || day < 1) return false;
    return day <= daysInMonth(year, month);
}

} // namespace

UnixTime nowUtc() {
    return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
}

Error parseOffset(const std::string& text, int& out_minutes) {
    const std::string s = trim(text);
    if (s.size() != 6 || (s[0] != '+' && s[0] != '-') || s[3] != ':') {
        return Error::InvalidOffset;
    }
    int hours = 0;
    int minutes = 0;
    if (!parseDigits(s, 1, 2, hours) || !parseDigits(s, 4, 2, minutes)) {
        return Error::InvalidOffset;
    }
    if (minutes > 59) return Error::InvalidOffset;
    const int total = hours * 60 + minutes;
    if (total > kMaxOffsetMinutes) return Error::InvalidOffset;
    out_minutes = s[0] == '-' ? -total : total;
    return Error::None;
}

std::string formatOffset(int offset_minutes) {
    const int abs_minutes = offset_minutes < 0 ? -offset_minutes : offset_minutes;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%c%02d:%02d",
                  offset_minutes < 0 ? '-' : '+', abs_minutes / 60, abs_minutes % 60);
    return buf;
}

Error parseLocalTime(const std::string& text, LocalTime& out) {
    const std::string s = trim(text);
    LocalTime parsed;

    std::string lowered = s;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "now") {
        parsed.immediate = true;
        out = parsed;
        return Error::None;
    }

    const size_t space = s.find(' ');
    if (space == std::string::npos) {
        if (!parseClock(s, parsed.hour, parsed.minute)) return Error::InvalidTime;
    } else {
        const std::string date_part = s.substr(0, space);
        const std::string time_part = trim(s.substr(space + 1));
        if (!parseDate(date_part, parsed.year, parsed.month, parsed.day)) return Error::InvalidTime;
        if (!parseClock(time_part, parsed.hour, parsed.minute)) return Error::InvalidTime;
        parsed.has_date = true;
    }
    out = parsed;
    return Error::None;
}

Error resolveDispatchInstant(const LocalTime& local,
                             int offset_minutes,
                             UnixTime now_utc,
                             UnixTime& out_instant) {
    if (offset_minutes > kMaxOffsetMinutes || offset_minutes < -kMaxOffsetMinutes) {
        return Error::InvalidOffset;
    }
    if (local.immediate) {
        out_instant = now_utc;
        return Error::None;
    }

    const int64_t offset_seconds = static_cast<int64_t>(offset_minutes) * 60;
    const int64_t clock_seconds = static_cast<int64_t>(local.hour) * 3600 + local.minute * 60;

    if (local.has_date) {
        const int64_t days = daysFromCivil(local.year,
                                           static_cast<unsigned>(local.month),
                                           static_cast<unsigned>(local.day));
        const UnixTime instant = days * kSecondsPerDay + clock_seconds - offset_seconds;
        if (instant < now_utc) return Error::TimeInPast;
        out_instant = instant;
        return Error::None;
    }

    const int64_t local_day = floorDiv(now_utc + offset_seconds, kSecondsPerDay);
    UnixTime instant = local_day * kSecondsPerDay + clock_seconds - offset_seconds;
    if (instant < now_utc) instant += kSecondsPerDay;
    out_instant = instant;
    return Error::None;
}

LocalTime toLocal(UnixTime instant, int offset_minutes) {
    const int64_t local_seconds = instant + static_cast<int64_t>(offset_minutes) * 60;
    const int64_t days = floorDiv(local_seconds, kSecondsPerDay);
    const int64_t in_day = local_seconds - days * kSecondsPerDay;

    LocalTime out;
    out.has_date = true;
    civilFromDays(days, out.year, out.month, out.day);
    out.hour = static_cast<int>(in_day / 3600);
    out.minute = static_cast<int>((in_day % 3600) / 60);
    return out;
}

std::string formatLocal(UnixTime instant, int offset_minutes) {
    const LocalTime t = toLocal(instant, offset_minutes);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d %02d.%02d.%04d",
                  t.hour, t.minute, t.day, t.month, t.year);
    return buf;
}

} // namespace postsched

#include "stressched/time_utils.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace stressched {
namespace time_utils {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Howard Hinnant's days_from_civil / civil_from_days.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    if (m <= 2) ++y;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return kDays[m - 1];
}

// Reads exactly `width` digits starting at `pos`.
bool read_digits(const std::string& s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += width;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

TimePoint from_epoch_seconds(int64_t secs) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(secs)));
}

int64_t to_epoch_seconds(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

std::optional<int64_t> parse_epoch_seconds(const std::string& raw) {
    std::string s = trim(raw);
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) s.pop_back();

    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-')) return std::nullopt;
    if (!read_digits(s, pos, 2, month) || !expect(s, pos, '-')) return std::nullopt;
    if (!read_digits(s, pos, 2, day)) return std::nullopt;

    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
        ++pos;
        if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':')) return std::nullopt;
        if (!read_digits(s, pos, 2, minute)) return std::nullopt;
        if (pos < s.size()) {
            if (!expect(s, pos, ':') || !read_digits(s, pos, 2, second)) return std::nullopt;
        }
        if (pos != s.size()) return std::nullopt;
    }

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * kSecondsPerDay + hour * 3600 + minute * 60 + second;
}

std::optional<TimePoint> parse_timestamp(const std::string& raw) {
    auto secs = parse_epoch_seconds(raw);
    if (!secs) return std::nullopt;
    const int64_t limit = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();
    if (*secs > limit || *secs < -limit) return std::nullopt;
    return from_epoch_seconds(*secs);
}

std::optional<TimePoint> at_time_of_day(TimePoint day, const std::string& hhmm) {
    std::string s = trim(hhmm);
    // tolerate "9:00" as well as "09:00"
    if (s.size() == 4 && s[1] == ':') s = "0" + s;
    size_t pos = 0;
    int hour = 0, minute = 0;
    if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') || !read_digits(s, pos, 2, minute)) {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;
    if (hour > 24 || minute > 59 || (hour == 24 && minute != 0)) return std::nullopt;
    return start_of_day(day) + std::chrono::hours(hour) + std::chrono::minutes(minute);
}

TimePoint start_of_day(TimePoint t) {
    int64_t secs = to_epoch_seconds(t);
    return from_epoch_seconds(floor_div(secs, kSecondsPerDay) * kSecondsPerDay);
}

// Differences go through milliseconds so extreme time points cannot overflow.
int minutes_between(TimePoint start, TimePoint end) {
    auto ms = epoch_millis(end) - epoch_millis(start);
    auto minutes = static_cast<int64_t>(std::llround(static_cast<double>(ms) / 60000.0));
    return minutes > 0 ? static_cast<int>(minutes) : 0;
}

double hours_between(TimePoint from, TimePoint to) {
    auto ms = epoch_millis(to) - epoch_millis(from);
    return static_cast<double>(ms) / (1000.0 * 60.0 * 60.0);
}

int64_t epoch_seconds(TimePoint t) {
    return to_epoch_seconds(t);
}

int64_t epoch_millis(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::string format_timestamp(TimePoint t) {
    int64_t secs = to_epoch_seconds(t);
    int64_t days = floor_div(secs, kSecondsPerDay);
    int64_t rem = secs - days * kSecondsPerDay;
    int64_t y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d",
                  static_cast<long long>(y), m, d,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60));
    return buf;
}

std::string format_clock(TimePoint t) {
    int64_t secs = to_epoch_seconds(t);
    int64_t rem = secs - floor_div(secs, kSecondsPerDay) * kSecondsPerDay;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d",
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60));
    return buf;
}

std::string format_duration(int minutes) {
    if (minutes < 60) return std::to_string(minutes) + "m";
    int hours = minutes / 60;
    int rest = minutes % 60;
    if (rest == 0) return std::to_string(hours) + "h";
    return std::to_string(hours) + "h " + std::to_string(rest) + "m";
}

} // namespace time_utils
} // namespace stressched

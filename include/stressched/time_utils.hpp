#pragma once
#include "task.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace stressched {
namespace time_utils {

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" and "YYYY-MM-DDTHH:MM:SS"
// (space separator and a trailing 'Z' are tolerated). All times are UTC.
// Returns nullopt outside the clock's range (roughly 1678-2262).
std::optional<TimePoint> parse_timestamp(const std::string& text);

// Same formats, as seconds since the epoch. Covers years 0000-9999.
std::optional<int64_t> parse_epoch_seconds(const std::string& text);

// "HH:MM" on the given day.
std::optional<TimePoint> at_time_of_day(TimePoint day, const std::string& hhmm);

TimePoint start_of_day(TimePoint t);

// round((end - start) / 1 minute), clamped to >= 0.
int minutes_between(TimePoint start, TimePoint end);

double hours_between(TimePoint from, TimePoint to);

int64_t epoch_seconds(TimePoint t);
int64_t epoch_millis(TimePoint t);

std::string format_timestamp(TimePoint t);
std::string format_clock(TimePoint t);

// 45 -> "45m", 120 -> "2h", 150 -> "2h 30m"
std::string format_duration(int minutes);

} // namespace time_utils
} // namespace stressched

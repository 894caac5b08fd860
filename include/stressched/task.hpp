#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stressched {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Priority { LOW, MEDIUM, HIGH };

struct Task {
    std::string id;                     // empty = assigned by the scheduler
    std::string title;
    std::string description;
    int estimated_duration_minutes{60};
    Priority priority{Priority::MEDIUM};
    std::string category{"work"};       // passthrough, never scored
    std::optional<std::string> deadline{}; // raw timestamp text
    bool is_flexible{true};
};

struct TimeWindow {
    TimePoint start{};
    TimePoint end{};
    std::string label;

    int duration_minutes() const;
};

struct StressContext {
    int level{5};
    std::string mood{"neutral"};
};

const char* to_string(Priority p);
// Lower-cased match; anything unrecognised is MEDIUM.
Priority parse_priority(const std::string& text);

} // namespace stressched

#include "stressched/task.hpp"
#include "stressched/time_utils.hpp"

#include <algorithm>
#include <cctype>

namespace stressched {

int TimeWindow::duration_minutes() const {
    return time_utils::minutes_between(start, end);
}

const char* to_string(Priority p) {
    switch (p) {
    case Priority::LOW: return "low";
    case Priority::HIGH: return "high";
    case Priority::MEDIUM: break;
    }
    return "medium";
}

Priority parse_priority(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "high") return Priority::HIGH;
    if (lower == "low") return Priority::LOW;
    return Priority::MEDIUM;
}

} // namespace stressched

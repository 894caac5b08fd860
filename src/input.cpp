#include "stressched/input.hpp"
#include "stressched/reporting.hpp"
#include "stressched/time_utils.hpp"

#include <fstream>
#include <sstream>

namespace stressched {
namespace input {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(trim(s.substr(start)));
            break;
        }
        parts.push_back(trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
    return parts;
}

// Leading digits only ("45min" -> 45); anything unusable falls back.
int parse_minutes(const std::string& text, int fallback) {
    long value = 0;
    size_t i = 0;
    for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
        value = value * 10 + (text[i] - '0');
        if (value > 24 * 60 * 7) return fallback;
    }
    if (i == 0 || value <= 0) return fallback;
    return static_cast<int>(value);
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) out.push_back(line);
    }
    return out;
}

} // namespace

std::optional<Task> parse_task_line(const std::string& line, size_t index) {
    if (trim(line).empty()) return std::nullopt;
    auto parts = split(line, '|');

    Task task;
    task.title = parts[0].empty() ? "Task " + std::to_string(index + 1) : parts[0];
    task.description = "Task: " + task.title;
    if (parts.size() > 1) task.estimated_duration_minutes = parse_minutes(parts[1], 60);
    if (parts.size() > 2 && !parts[2].empty()) task.priority = parse_priority(parts[2]);
    if (parts.size() > 3 && !parts[3].empty()) task.deadline = parts[3];
    return task;
}

std::vector<Task> parse_tasks(const std::string& text) {
    std::vector<Task> tasks;
    auto lines = lines_of(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (auto t = parse_task_line(lines[i], i)) tasks.push_back(*t);
    }
    return tasks;
}

std::optional<TimeWindow> parse_slot_line(const std::string& line, TimePoint day, size_t index) {
    std::string s = trim(line);
    if (s.empty()) return std::nullopt;

    auto space = s.find_first_of(" \t");
    std::string range = s.substr(0, space);
    std::string label = space == std::string::npos ? std::string() : trim(s.substr(space));

    auto dash = range.find('-');
    if (dash == std::string::npos) return std::nullopt;
    auto start = time_utils::at_time_of_day(day, range.substr(0, dash));
    auto end = time_utils::at_time_of_day(day, range.substr(dash + 1));
    if (!start || !end) return std::nullopt;

    TimeWindow w;
    w.start = *start;
    w.end = *end;
    w.label = label.empty() ? "Time slot " + std::to_string(index + 1) : label;
    return w;
}

std::vector<TimeWindow> parse_slots(const std::string& text, TimePoint day) {
    std::vector<TimeWindow> windows;
    auto lines = lines_of(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        auto w = parse_slot_line(lines[i], day, i);
        if (!w) {
            reporting::warn("input", "invalid time slot format: " + trim(lines[i]));
            continue;
        }
        windows.push_back(*w);
    }
    return windows;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace input
} // namespace stressched

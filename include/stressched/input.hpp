#pragma once
#include "task.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stressched {
namespace input {

// "title | duration | priority | deadline", only the title is required.
// Returns nullopt for blank lines.
std::optional<Task> parse_task_line(const std::string& line, size_t index);
std::vector<Task> parse_tasks(const std::string& text);

// "HH:MM-HH:MM [label...]" on `day`. `index` is 0-based and only used for
// the default label.
std::optional<TimeWindow> parse_slot_line(const std::string& line, TimePoint day, size_t index);
// Malformed lines are skipped with a warning.
std::vector<TimeWindow> parse_slots(const std::string& text, TimePoint day);

std::optional<std::string> read_file(const std::string& path);

} // namespace input
} // namespace stressched

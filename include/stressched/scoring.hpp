#pragma once
#include "task.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace stressched {

enum class TaskType { DEEP_WORK, CREATIVE, ADMINISTRATIVE, ROUTINE };

struct ScoredTask {
    Task task;
    size_t input_index{0};
    double deadline_urgency{0.2};
    double importance{0.6};
    double complexity{0.5};
    TaskType task_type{TaskType::ROUTINE};
    double stress_compatibility{1.0};
    double final_priority{0.0};
};

const char* to_string(TaskType t);

namespace scoring {

constexpr double kUrgencyWeight = 0.5;
constexpr double kImportanceWeight = 0.3;
constexpr double kCompatibilityWeight = 0.2;

double deadline_urgency(const Task& task, TimePoint now);
double importance(Priority p);
double complexity(const std::string& title);
TaskType classify(const std::string& title);
double stress_compatibility(double complexity, int stress_level);
double final_priority(double urgency, double importance, double compatibility);

} // namespace scoring

ScoredTask score(const Task& task, int stress_level, TimePoint now, size_t input_index = 0);

// Scores every task and orders the result by final priority, highest first.
// Equal priorities keep their input order.
std::vector<ScoredTask> score_all(const std::vector<Task>& tasks, int stress_level, TimePoint now);

} // namespace stressched

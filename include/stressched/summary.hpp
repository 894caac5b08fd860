#pragma once
#include "allocator.hpp"
#include "task.hpp"
#include <string>
#include <vector>

namespace stressched {

struct StressAnalysis {
    int level{0};
    std::string mood;
    std::string impact;
    std::vector<std::string> recommended_actions;
};

struct TaskAnalysis {
    size_t total_tasks{0};
    size_t scheduled_tasks{0};
};

struct Insights {
    double total_work_hours{0.0};
    double average_confidence{0.0};
    std::vector<std::string> recommendations;
    std::string mood_optimization;
};

struct WorkloadAlert {
    std::string type;
    std::string message;
    std::string suggested_action;
    double total_work_hours{0.0};
    int stress_level{0};
};

struct PostponementSuggestion {
    std::string task_id;
    std::string task_title;
    std::string reason;
    std::string suggested_new_time;
};

// Advice attached to one scheduled item. Never touches notes or capacity.
struct TaskGuidance {
    size_t item_index{0};  // position in ScheduleResult::items
    std::string task_id;
    std::vector<std::string> tips;
    int break_minutes{0};  // suggested break after the task, 0 = none
};

namespace summary {

double total_work_hours(const std::vector<ScheduleItem>& items);
double average_confidence(const std::vector<ScheduleItem>& items);
size_t scheduled_count(const std::vector<ScheduleItem>& items);
size_t count_status(const std::vector<ScheduleItem>& items, ItemStatus status);

std::vector<std::string> recommendations(const std::vector<ScheduleItem>& items, int stress_level);
std::string stress_impact(int stress_level);
std::vector<std::string> stress_actions(int stress_level);
std::string mood_optimization(const std::string& mood);

std::vector<WorkloadAlert> workload_alerts(const std::vector<ScheduleItem>& items, int stress_level);
std::vector<PostponementSuggestion> postponement_suggestions(const std::vector<ScheduleItem>& items,
                                                             int stress_level);

std::vector<std::string> task_tips(const Task& task, const StressContext& stress);
// 15 under high stress, 10 after two hours, 5 after one hour, else 0.
int break_minutes(int task_minutes, int stress_level);
// Scheduled items only, in input order.
std::vector<TaskGuidance> task_guidance(const std::vector<ScheduleItem>& items, const StressContext& stress);

StressAnalysis analyze_stress(const StressContext& stress);
TaskAnalysis analyze_tasks(const std::vector<ScheduleItem>& items);
Insights build_insights(const std::vector<ScheduleItem>& items, const StressContext& stress);

} // namespace summary
} // namespace stressched

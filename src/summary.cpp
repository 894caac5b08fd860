#include "stressched/summary.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace stressched {
namespace summary {

namespace {
constexpr double kHighStressHoursLimit = 6.0;
constexpr double kDailyHoursLimit = 8.0;
constexpr int kHighStress = 7;
constexpr int kChunkMinutes = 60;

std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}
} // namespace

double total_work_hours(const std::vector<ScheduleItem>& items) {
    long long minutes = 0;
    for (const auto& item : items) minutes += item.allocated_minutes;
    return static_cast<double>(minutes) / 60.0;
}

double average_confidence(const std::vector<ScheduleItem>& items) {
    if (items.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& item : items) sum += item.confidence;
    return sum / static_cast<double>(items.size());
}

size_t scheduled_count(const std::vector<ScheduleItem>& items) {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [](const ScheduleItem& i) { return i.allocated_minutes > 0; }));
}

size_t count_status(const std::vector<ScheduleItem>& items, ItemStatus status) {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [status](const ScheduleItem& i) { return i.status == status; }));
}

std::vector<std::string> recommendations(const std::vector<ScheduleItem>& items, int stress_level) {
    std::vector<std::string> out;
    if (scheduled_count(items) == items.size()) {
        out.push_back("All tasks successfully scheduled!");
    } else {
        size_t unscheduled = count_status(items, ItemStatus::NOT_SCHEDULED);
        size_t partial = count_status(items, ItemStatus::PARTIAL);
        if (unscheduled > 0) {
            out.push_back(std::to_string(unscheduled)
                          + " tasks need additional time slots - consider adding more time blocks");
        }
        if (partial > 0) {
            out.push_back(std::to_string(partial) + " tasks are partially scheduled - plan follow-up sessions");
        }
    }
    if (stress_level >= 7) out.push_back("High stress detected - take breaks between tasks");
    return out;
}

std::string stress_impact(int stress_level) {
    if (stress_level >= 8) return "High stress significantly limits task capacity";
    if (stress_level >= 5) return "Moderate stress affects task selection";
    return "Low stress allows for optimal productivity";
}

std::vector<std::string> stress_actions(int stress_level) {
    if (stress_level >= 7) return {"simplify_tasks", "add_breaks", "postpone_non_urgent"};
    if (stress_level >= 4) return {"balance_tasks", "moderate_breaks"};
    return {"challenge_optimal", "minimal_breaks"};
}

std::string mood_optimization(const std::string& mood) {
    return "Schedule optimized for " + mood + " mood state";
}

std::vector<WorkloadAlert> workload_alerts(const std::vector<ScheduleItem>& items, int stress_level) {
    std::vector<WorkloadAlert> out;
    double hours = total_work_hours(items);
    if (stress_level >= 7 && hours > kHighStressHoursLimit) {
        out.push_back({"high_stress_heavy_workload",
                       "High stress level combined with heavy workload detected",
                       "Consider rescheduling non-urgent tasks or adding more breaks",
                       hours, stress_level});
    }
    if (hours > kDailyHoursLimit) {
        out.push_back({"excessive_workload",
                       "Schedule exceeds recommended daily work hours",
                       "Consider postponing some tasks to maintain productivity and wellbeing",
                       hours, stress_level});
    }
    return out;
}

std::vector<PostponementSuggestion> postponement_suggestions(const std::vector<ScheduleItem>& items,
                                                             int stress_level) {
    std::vector<PostponementSuggestion> out;
    if (stress_level < 8) return out;
    for (const auto& item : items) {
        if (item.allocated_minutes == 0) continue;
        if (item.task.priority != Priority::LOW || !item.task.is_flexible) continue;
        out.push_back({item.task.id, item.task.title,
                       "High stress level reduces effectiveness for non-urgent tasks",
                       "Tomorrow or when stress level decreases"});
    }
    return out;
}

std::vector<std::string> task_tips(const Task& task, const StressContext& stress) {
    std::vector<std::string> tips;
    if (stress.level >= kHighStress) {
        if (task.estimated_duration_minutes > kChunkMinutes) {
            tips.push_back("Consider breaking this task into smaller chunks due to high stress");
        }
        tips.push_back("Take short breaks every 25 minutes to maintain focus");
    }
    const std::string mood = lower(stress.mood);
    if (mood == "tired") {
        tips.push_back("This might feel challenging given your current energy level");
    } else if (mood == "energetic") {
        tips.push_back("Good time to tackle this with your current energy");
    } else if (mood == "scattered") {
        tips.push_back("Try minimizing distractions while working on this task");
    }
    if (task.priority == Priority::HIGH) tips.push_back("High priority task - focus on completion");
    return tips;
}

int break_minutes(int task_minutes, int stress_level) {
    if (stress_level >= kHighStress) return 15;
    if (task_minutes >= 120) return 10;
    if (task_minutes >= 60) return 5;
    return 0;
}

std::vector<TaskGuidance> task_guidance(const std::vector<ScheduleItem>& items, const StressContext& stress) {
    std::vector<TaskGuidance> out;
    for (size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        if (item.allocated_minutes == 0) continue;
        TaskGuidance g;
        g.item_index = i;
        g.task_id = item.task.id;
        g.tips = task_tips(item.task, stress);
        g.break_minutes = break_minutes(item.task.estimated_duration_minutes, stress.level);
        if (g.tips.empty() && g.break_minutes == 0) continue;
        out.push_back(std::move(g));
    }
    return out;
}

StressAnalysis analyze_stress(const StressContext& stress) {
    StressAnalysis a;
    a.level = stress.level;
    a.mood = stress.mood;
    a.impact = stress_impact(stress.level);
    a.recommended_actions = stress_actions(stress.level);
    return a;
}

TaskAnalysis analyze_tasks(const std::vector<ScheduleItem>& items) {
    return {items.size(), scheduled_count(items)};
}

Insights build_insights(const std::vector<ScheduleItem>& items, const StressContext& stress) {
    Insights in;
    in.total_work_hours = total_work_hours(items);
    in.average_confidence = average_confidence(items);
    in.recommendations = recommendations(items, stress.level);
    in.mood_optimization = mood_optimization(stress.mood);
    return in;
}

} // namespace summary
} // namespace stressched

#pragma once
#include "allocator.hpp"
#include "summary.hpp"
#include "task.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace stressched {

// Malformed input, raised before any allocation happens.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

struct ScheduleRequest {
    std::vector<Task> tasks;
    std::vector<TimeWindow> windows;
    StressContext stress{};
    TimePoint now{Clock::now()};  // reference time for deadlines and generated ids
};

struct ScheduleResult {
    std::vector<ScheduleItem> items;  // input order
    std::vector<TimeWindow> windows;  // ScheduleItem::window indexes into this
    StressAnalysis stress_analysis;
    TaskAnalysis task_analysis;
    Insights insights;
    std::vector<WorkloadAlert> workload_alerts;
    std::vector<PostponementSuggestion> postponement_suggestions;
    std::vector<TaskGuidance> task_guidance;
    std::string allocator;
};

class Scheduler {
public:
    explicit Scheduler(SchedulerOptions opts = {}, std::unique_ptr<Allocator> allocator = nullptr);
    ~Scheduler();

    // Throws ValidationError on malformed input. Holds no per-call state, so
    // independent requests may be scheduled concurrently.
    ScheduleResult schedule(const ScheduleRequest& request) const;

    void validate(const ScheduleRequest& request) const;
    const SchedulerOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

ScheduleResult schedule(const std::vector<Task>& tasks, const std::vector<TimeWindow>& windows,
                        int stress_level, const std::string& mood, TimePoint now = Clock::now());

} // namespace stressched

#include "stressched/scheduler.hpp"
#include "stressched/capacity.hpp"
#include "stressched/reporting.hpp"
#include "stressched/scoring.hpp"
#include "stressched/time_utils.hpp"

#include <set>
#include <string>
#include <utility>

namespace stressched {

namespace {

bool blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string window_name(const TimeWindow& w, size_t index) {
    if (!w.label.empty()) return "\"" + w.label + "\"";
    return "#" + std::to_string(index + 1);
}

} // namespace

class Scheduler::Impl {
public:
    Impl(SchedulerOptions opts, std::unique_ptr<Allocator> allocator)
        : opts_(opts),
          allocator_(allocator ? std::move(allocator) : make_greedy_allocator(opts)) {}

    void validate(const ScheduleRequest& req) const {
        if (req.tasks.empty()) throw ValidationError("task list cannot be empty");
        if (req.windows.empty()) throw ValidationError("time window list cannot be empty");
        if (req.stress.level < 0 || req.stress.level > 10) {
            throw ValidationError("stress level must be between 0 and 10, got " + std::to_string(req.stress.level));
        }
        for (size_t i = 0; i < req.windows.size(); ++i) {
            const auto& w = req.windows[i];
            if (w.end <= w.start || w.duration_minutes() <= 0) {
                throw ValidationError("time window " + window_name(w, i) + " has non-positive duration");
            }
        }
        for (size_t i = 0; i < req.tasks.size(); ++i) {
            const auto& t = req.tasks[i];
            if (blank(t.title)) throw ValidationError("task #" + std::to_string(i + 1) + " has an empty title");
            if (t.estimated_duration_minutes <= 0) {
                throw ValidationError("task \"" + t.title + "\" has non-positive duration "
                                      + std::to_string(t.estimated_duration_minutes));
            }
        }
    }

    // Fills in missing ids and rejects collisions.
    std::vector<Task> with_ids(const ScheduleRequest& req) const {
        std::vector<Task> tasks = req.tasks;
        const auto stamp = std::to_string(time_utils::epoch_millis(req.now));
        std::set<std::string> ids;
        for (size_t i = 0; i < tasks.size(); ++i) {
            if (tasks[i].id.empty()) tasks[i].id = "task_" + stamp + "_" + std::to_string(i);
            if (!ids.insert(tasks[i].id).second) throw ValidationError("duplicate task id " + tasks[i].id);
        }
        return tasks;
    }

    ScheduleResult schedule(const ScheduleRequest& req) const {
        validate(req);
        auto tasks = with_ids(req);

        auto scored = score_all(tasks, req.stress.level, req.now);
        CapacityTracker tracker(req.windows);
        reporting::debug("scheduler", "scheduling " + std::to_string(tasks.size()) + " tasks into "
                         + std::to_string(req.windows.size()) + " windows ("
                         + std::to_string(tracker.total_capacity()) + " min) with "
                         + allocator_->name());

        ScheduleResult result;
        result.items = allocator_->allocate(scored, tracker);
        result.windows = req.windows;
        result.stress_analysis = summary::analyze_stress(req.stress);
        result.task_analysis = summary::analyze_tasks(result.items);
        result.insights = summary::build_insights(result.items, req.stress);
        result.workload_alerts = summary::workload_alerts(result.items, req.stress.level);
        result.postponement_suggestions = summary::postponement_suggestions(result.items, req.stress.level);
        result.task_guidance = summary::task_guidance(result.items, req.stress);
        result.allocator = allocator_->name();

        reporting::debug("scheduler", "scheduled " + std::to_string(result.task_analysis.scheduled_tasks) + "/"
                         + std::to_string(result.task_analysis.total_tasks) + " tasks");
        return result;
    }

    const SchedulerOptions& options() const { return opts_; }

private:
    SchedulerOptions opts_;
    std::unique_ptr<Allocator> allocator_;
};

// -------------- thin wrappers --------------
Scheduler::Scheduler(SchedulerOptions opts, std::unique_ptr<Allocator> allocator)
    : impl_(std::make_unique<Impl>(opts, std::move(allocator))) {}

Scheduler::~Scheduler() = default;

ScheduleResult Scheduler::schedule(const ScheduleRequest& request) const { return impl_->schedule(request); }
void Scheduler::validate(const ScheduleRequest& request) const { impl_->validate(request); }
const SchedulerOptions& Scheduler::options() const { return impl_->options(); }

ScheduleResult schedule(const std::vector<Task>& tasks, const std::vector<TimeWindow>& windows,
                        int stress_level, const std::string& mood, TimePoint now) {
    ScheduleRequest req;
    req.tasks = tasks;
    req.windows = windows;
    req.stress.level = stress_level;
    req.stress.mood = mood;
    req.now = now;
    return Scheduler().schedule(req);
}

} // namespace stressched

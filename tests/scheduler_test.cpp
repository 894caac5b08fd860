#include "stressched/scheduler.hpp"
#include "stressched/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace stressched;
using namespace std::chrono_literals;

namespace {

const TimePoint kNow = *time_utils::parse_timestamp("2025-10-13T08:00:00");

TimeWindow window(const std::string& from, const std::string& to, const std::string& label = "") {
    TimeWindow w;
    w.start = *time_utils::at_time_of_day(kNow, from);
    w.end = *time_utils::at_time_of_day(kNow, to);
    w.label = label;
    return w;
}

Task task(const std::string& title, int minutes, Priority priority = Priority::MEDIUM) {
    Task t;
    t.title = title;
    t.estimated_duration_minutes = minutes;
    t.priority = priority;
    return t;
}

Task due_in(Task t, std::chrono::hours h) {
    t.deadline = time_utils::format_timestamp(kNow + h);
    return t;
}

ScheduleRequest request(std::vector<Task> tasks, std::vector<TimeWindow> windows, int stress = 5,
                        const std::string& mood = "neutral") {
    ScheduleRequest req;
    req.tasks = std::move(tasks);
    req.windows = std::move(windows);
    req.stress.level = stress;
    req.stress.mood = mood;
    req.now = kNow;
    return req;
}

void expect_consistent(const ScheduleResult& r) {
    std::map<size_t, int> used;
    for (const auto& item : r.items) {
        switch (item.status) {
        case ItemStatus::COMPLETE:
        case ItemStatus::SCALED:
            EXPECT_EQ(item.allocated_minutes, item.task.estimated_duration_minutes) << item.task.title;
            break;
        case ItemStatus::PARTIAL:
            EXPECT_GT(item.allocated_minutes, 0) << item.task.title;
            EXPECT_LT(item.allocated_minutes, item.task.estimated_duration_minutes) << item.task.title;
            break;
        case ItemStatus::NOT_SCHEDULED:
            EXPECT_EQ(item.allocated_minutes, 0) << item.task.title;
            EXPECT_FALSE(item.window.has_value()) << item.task.title;
            EXPECT_DOUBLE_EQ(item.confidence, 0.0);
            break;
        }
        EXPECT_FALSE(item.notes.empty()) << item.task.title;
        if (item.window) {
            ASSERT_LT(*item.window, r.windows.size());
            used[*item.window] += item.allocated_minutes;
        }
    }
    for (const auto& kv : used) {
        EXPECT_LE(kv.second, r.windows[kv.first].duration_minutes()) << "window " << kv.first;
    }
}

class NothingAllocator : public Allocator {
public:
    std::string name() const override { return "nothing"; }
    std::vector<ScheduleItem> allocate(const std::vector<ScoredTask>& ordered, CapacityTracker&) override {
        std::vector<ScheduleItem> items(ordered.size());
        for (const auto& t : ordered) {
            items[t.input_index].task = t.task;
            items[t.input_index].notes.push_back("skipped");
        }
        return items;
    }
};

} // namespace

TEST(Scheduler, SingleTaskFitsWindow) {
    auto r = Scheduler().schedule(request({task("Finish slides", 60, Priority::HIGH)},
                                          {window("09:00", "10:30", "Morning")}));
    ASSERT_EQ(r.items.size(), 1u);
    const auto& item = r.items[0];
    EXPECT_EQ(item.status, ItemStatus::COMPLETE);
    EXPECT_EQ(item.allocated_minutes, 60);
    EXPECT_DOUBLE_EQ(item.confidence, 0.9);
    EXPECT_DOUBLE_EQ(item.deadline_urgency, 0.2);
    EXPECT_EQ(item.notes[0], "Perfect fit in 90-minute slot");
    EXPECT_EQ(r.task_analysis.scheduled_tasks, 1u);
    EXPECT_EQ(r.insights.recommendations[0], "All tasks successfully scheduled!");
    EXPECT_EQ(r.allocator, "greedy-three-phase");
}

TEST(Scheduler, OversizedTaskIsPartial) {
    auto r = Scheduler().schedule(request({task("Long report", 120)}, {window("09:00", "10:00")}));
    const auto& item = r.items[0];
    EXPECT_EQ(item.status, ItemStatus::PARTIAL);
    EXPECT_EQ(item.allocated_minutes, 60);
    EXPECT_DOUBLE_EQ(item.confidence, 0.6);
    EXPECT_EQ(item.notes[0], "Partial scheduling: 60 of 120 minutes");
    // partial allocations still count as scheduled
    EXPECT_EQ(r.insights.recommendations[0], "All tasks successfully scheduled!");
    expect_consistent(r);
}

TEST(Scheduler, MissingWindowsIsAnError) {
    EXPECT_THROW(Scheduler().schedule(request({due_in(task("Hotfix", 60, Priority::HIGH), 2h)}, {})),
                 ValidationError);
}

TEST(Scheduler, LowPriorityLosesContestedWindow) {
    auto r = Scheduler().schedule(request({task("Tidy desk", 60, Priority::LOW),
                                           due_in(task("Ship fix", 60, Priority::HIGH), 2h)},
                                          {window("09:00", "10:00")}));
    EXPECT_EQ(r.items[1].status, ItemStatus::COMPLETE);
    EXPECT_EQ(r.items[0].status, ItemStatus::NOT_SCHEDULED);
    EXPECT_EQ(r.items[0].notes[0], "No available time slots remaining - consider adding more time blocks");
    EXPECT_EQ(r.insights.recommendations[0], "1 tasks need additional time slots - consider adding more time blocks");
    expect_consistent(r);
}

TEST(Scheduler, RescuesUrgentTaskIntoLeftover) {
    auto r = Scheduler().schedule(request({due_in(task("Prepare slides", 88, Priority::HIGH), 2h),
                                           due_in(task("Call vendor", 50, Priority::HIGH), 2h),
                                           due_in(task("Detailed analysis", 62, Priority::HIGH), 2h)},
                                          {window("09:00", "10:40", "A"), window("11:00", "11:50", "B")}));
    EXPECT_EQ(r.items[0].status, ItemStatus::COMPLETE);
    EXPECT_EQ(*r.items[0].window, 0u);
    EXPECT_EQ(r.items[1].status, ItemStatus::COMPLETE);
    EXPECT_EQ(*r.items[1].window, 1u);

    const auto& rescued = r.items[2];
    EXPECT_EQ(rescued.status, ItemStatus::PARTIAL);
    EXPECT_EQ(*rescued.window, 0u);
    EXPECT_EQ(rescued.allocated_minutes, 12);
    EXPECT_DOUBLE_EQ(rescued.confidence, 0.5);
    ASSERT_EQ(rescued.notes.size(), 1u);
    EXPECT_EQ(rescued.notes[0], "Emergency scheduling: 12 minutes for high-priority task");
    expect_consistent(r);
}

TEST(Scheduler, ItemsFollowInputOrder) {
    std::vector<Task> tasks = {task("Laundry", 20, Priority::LOW), task("Write tests", 40, Priority::HIGH),
                               task("Groceries", 30)};
    auto r = Scheduler().schedule(request(tasks, {window("09:00", "12:00")}));
    ASSERT_EQ(r.items.size(), tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) EXPECT_EQ(r.items[i].task.title, tasks[i].title);
}

TEST(Scheduler, NeverOverfillsWindows) {
    std::vector<Task> tasks;
    for (int i = 0; i < 12; ++i) {
        auto t = task("Job " + std::to_string(i), 25 + 17 * i, i % 3 == 0 ? Priority::HIGH : Priority::MEDIUM);
        if (i % 4 == 0) t = due_in(t, std::chrono::hours(i));
        tasks.push_back(t);
    }
    auto r = Scheduler().schedule(request(tasks, {window("08:00", "09:10"), window("10:00", "10:40"),
                                                  window("11:00", "13:00"), window("14:00", "14:12")},
                                          9));
    expect_consistent(r);
    EXPECT_LT(r.task_analysis.scheduled_tasks, tasks.size());
}

TEST(Scheduler, DeterministicForSameInput) {
    auto req = request({task("Alpha", 50), due_in(task("Beta", 80, Priority::HIGH), 30h),
                        task("Gamma review", 45, Priority::LOW)},
                       {window("09:00", "10:00"), window("13:00", "14:30")}, 6);
    Scheduler scheduler;
    auto a = scheduler.schedule(req);
    auto b = scheduler.schedule(req);
    ASSERT_EQ(a.items.size(), b.items.size());
    for (size_t i = 0; i < a.items.size(); ++i) {
        EXPECT_EQ(a.items[i].task.id, b.items[i].task.id);
        EXPECT_EQ(a.items[i].window, b.items[i].window);
        EXPECT_EQ(a.items[i].allocated_minutes, b.items[i].allocated_minutes);
        EXPECT_EQ(a.items[i].status, b.items[i].status);
        EXPECT_EQ(a.items[i].notes, b.items[i].notes);
    }
}

TEST(Scheduler, GeneratesMissingIds) {
    auto t = task("Named", 30);
    t.id = "custom";
    auto r = Scheduler().schedule(request({task("Anonymous", 30), t}, {window("09:00", "10:00")}));
    EXPECT_EQ(r.items[0].task.id, "task_1760342400000_0");
    EXPECT_EQ(r.items[1].task.id, "custom");
}

TEST(Scheduler, RejectsMalformedRequests) {
    Scheduler s;
    auto w = window("09:00", "10:00", "Morning");

    EXPECT_THROW(s.schedule(request({}, {w})), ValidationError);
    EXPECT_THROW(s.schedule(request({task("Ok", 30)}, {w}, 11)), ValidationError);
    EXPECT_THROW(s.schedule(request({task("Ok", 30)}, {w}, -1)), ValidationError);
    EXPECT_THROW(s.schedule(request({task("  ", 30)}, {w})), ValidationError);
    EXPECT_THROW(s.schedule(request({task("Zero", 0)}, {w})), ValidationError);
    EXPECT_THROW(s.schedule(request({task("Ok", 30)}, {window("10:00", "09:00")})), ValidationError);

    auto a = task("A", 10);
    auto b = task("B", 10);
    a.id = b.id = "same";
    EXPECT_THROW(s.schedule(request({a, b}, {w})), ValidationError);

    try {
        s.validate(request({task("Ok", 30)}, {window("10:00", "10:00", "Empty")}));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "time window \"Empty\" has non-positive duration");
    }
}

TEST(Scheduler, ValidationErrorIsInvalidArgument) {
    EXPECT_THROW(Scheduler().schedule(request({task("Ok", 30)}, {})), std::invalid_argument);
}

TEST(Scheduler, ReportsStressAndWorkload) {
    std::vector<Task> tasks = {task("Big block one", 300), task("Big block two", 240),
                               task("Tidy inbox", 30, Priority::LOW)};
    auto r = Scheduler().schedule(request(tasks, {window("08:00", "13:00"), window("13:00", "17:00"),
                                                  window("17:00", "17:30")},
                                          8, "anxious"));
    EXPECT_EQ(r.stress_analysis.level, 8);
    EXPECT_EQ(r.stress_analysis.impact, "High stress significantly limits task capacity");
    EXPECT_EQ(r.insights.mood_optimization, "Schedule optimized for anxious mood state");
    EXPECT_DOUBLE_EQ(r.insights.total_work_hours, 9.5);

    ASSERT_EQ(r.workload_alerts.size(), 2u);
    EXPECT_EQ(r.workload_alerts[0].type, "high_stress_heavy_workload");
    EXPECT_EQ(r.workload_alerts[1].type, "excessive_workload");

    ASSERT_EQ(r.postponement_suggestions.size(), 1u);
    EXPECT_EQ(r.postponement_suggestions[0].task_title, "Tidy inbox");
    EXPECT_EQ(r.insights.recommendations.back(), "High stress detected - take breaks between tasks");
}

TEST(Scheduler, AcceptsCustomAllocator) {
    Scheduler s({}, std::make_unique<NothingAllocator>());
    auto r = s.schedule(request({task("Anything", 30)}, {window("09:00", "10:00")}));
    EXPECT_EQ(r.allocator, "nothing");
    EXPECT_EQ(r.items[0].status, ItemStatus::NOT_SCHEDULED);
    EXPECT_EQ(r.task_analysis.scheduled_tasks, 0u);
}

TEST(Scheduler, FreeFunction) {
    auto r = schedule({task("Read paper", 45)}, {window("09:00", "10:00")}, 3, "calm", kNow);
    EXPECT_EQ(r.items[0].status, ItemStatus::COMPLETE);
    EXPECT_EQ(r.stress_analysis.recommended_actions,
              (std::vector<std::string>{"challenge_optimal", "minimal_breaks"}));
}

TEST(Scheduler, FarFutureDeadlineDoesNotTriggerRescue) {
    auto t = task("Someday", 60, Priority::LOW);
    t.deadline = "9999-12-31";
    auto r = Scheduler().schedule(request({t}, {window("09:00", "09:12")}));
    EXPECT_DOUBLE_EQ(r.items[0].deadline_urgency, 0.3);
    EXPECT_EQ(r.items[0].status, ItemStatus::NOT_SCHEDULED);
}

TEST(Scheduler, GuidanceLeavesNotesAlone) {
    auto r = Scheduler().schedule(request({task("Long report", 120, Priority::HIGH)},
                                          {window("09:00", "11:00")}, 7, "tired"));
    ASSERT_EQ(r.items[0].notes.size(), 1u);
    EXPECT_EQ(r.items[0].notes[0], "Perfect fit in 120-minute slot");
    ASSERT_EQ(r.task_guidance.size(), 1u);
    EXPECT_EQ(r.task_guidance[0].tips.size(), 4u);
    EXPECT_EQ(r.task_guidance[0].break_minutes, 15);
}

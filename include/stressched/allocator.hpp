#pragma once
#include "capacity.hpp"
#include "scoring.hpp"
#include "task.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stressched {

enum class ItemStatus { COMPLETE, PARTIAL, SCALED, NOT_SCHEDULED };

struct ScheduleItem {
    Task task;
    std::optional<size_t> window{};  // index into the request's windows
    int allocated_minutes{0};
    ItemStatus status{ItemStatus::NOT_SCHEDULED};
    double confidence{0.0};
    double deadline_urgency{0.0};
    std::vector<std::string> notes;
};

const char* to_string(ItemStatus s);

struct SchedulerOptions {
    int partial_fit_floor = 15;     // phase 2 minimum usable window
    int rescue_floor = 10;          // phase 3 minimum usable window
    double rescue_urgency = 0.8;    // urgency strictly above this qualifies for rescue
};

class Allocator {
public:
    virtual ~Allocator() = default;
    virtual std::string name() const = 0;
    // `ordered` is sorted by final priority; the result is in input order,
    // one item per task.
    virtual std::vector<ScheduleItem> allocate(const std::vector<ScoredTask>& ordered,
                                               CapacityTracker& tracker) = 0;
};

class GreedyAllocator : public Allocator {
public:
    explicit GreedyAllocator(SchedulerOptions opts = {});
    std::string name() const override { return "greedy-three-phase"; }
    std::vector<ScheduleItem> allocate(const std::vector<ScoredTask>& ordered,
                                       CapacityTracker& tracker) override;

private:
    std::optional<size_t> best_fit(const CapacityTracker& tracker, int minutes) const;
    std::optional<size_t> largest_window(const CapacityTracker& tracker) const;
    std::optional<size_t> first_usable(const CapacityTracker& tracker) const;
    bool rescuable(const ScoredTask& t) const;

    SchedulerOptions opts_;
};

std::unique_ptr<Allocator> make_greedy_allocator(SchedulerOptions opts = {});

} // namespace stressched

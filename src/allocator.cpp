#include "stressched/allocator.hpp"
#include "stressched/reporting.hpp"

#include <algorithm>
#include <stdexcept>

namespace stressched {

namespace {

constexpr double kPerfectFitConfidence = 0.9;
constexpr double kFitConfidence = 0.8;
constexpr double kPartialConfidence = 0.6;
constexpr double kRescueConfidence = 0.5;

const char kNoSlotNote[] = "No available time slots remaining - consider adding more time blocks";

void assign(ScheduleItem& item, size_t window, int minutes, ItemStatus status, double confidence,
            std::string note) {
    item.window = window;
    item.allocated_minutes = minutes;
    item.status = status;
    item.confidence = confidence;
    item.notes.clear();
    item.notes.push_back(std::move(note));
}

} // namespace

const char* to_string(ItemStatus s) {
    switch (s) {
    case ItemStatus::COMPLETE: return "complete";
    case ItemStatus::PARTIAL: return "partial";
    case ItemStatus::SCALED: return "scaled";
    case ItemStatus::NOT_SCHEDULED: break;
    }
    return "not_scheduled";
}

GreedyAllocator::GreedyAllocator(SchedulerOptions opts) : opts_(opts) {}

std::optional<size_t> GreedyAllocator::best_fit(const CapacityTracker& tracker, int minutes) const {
    std::optional<size_t> best;
    int best_leftover = 0;
    for (size_t i = 0; i < tracker.size(); ++i) {
        if (!tracker.usable(i, minutes)) continue;
        int leftover = tracker.remaining(i) - minutes;
        // strict less-than keeps the earliest window on ties
        if (!best || leftover < best_leftover) {
            best = i;
            best_leftover = leftover;
        }
    }
    return best;
}

std::optional<size_t> GreedyAllocator::largest_window(const CapacityTracker& tracker) const {
    std::optional<size_t> best;
    for (size_t i = 0; i < tracker.size(); ++i) {
        if (!tracker.usable(i, opts_.partial_fit_floor)) continue;
        if (!best || tracker.remaining(i) > tracker.remaining(*best)) best = i;
    }
    return best;
}

std::optional<size_t> GreedyAllocator::first_usable(const CapacityTracker& tracker) const {
    for (size_t i = 0; i < tracker.size(); ++i) {
        if (tracker.usable(i, opts_.rescue_floor)) return i;
    }
    return std::nullopt;
}

bool GreedyAllocator::rescuable(const ScoredTask& t) const {
    return t.task.priority == Priority::HIGH || t.deadline_urgency > opts_.rescue_urgency;
}

std::vector<ScheduleItem> GreedyAllocator::allocate(const std::vector<ScoredTask>& ordered,
                                                    CapacityTracker& tracker) {
    std::vector<ScheduleItem> items(ordered.size());
    std::vector<bool> seen(ordered.size(), false);
    long long requested = 0;
    for (const auto& t : ordered) {
        if (t.input_index >= items.size() || seen[t.input_index]) {
            throw std::invalid_argument("allocator: scored tasks must cover input positions 0.."
                                        + std::to_string(items.size() - 1) + " exactly once");
        }
        seen[t.input_index] = true;
        auto& item = items[t.input_index];
        item.task = t.task;
        item.deadline_urgency = t.deadline_urgency;
        requested += t.task.estimated_duration_minutes;
    }
    const bool overcommitted = requested > tracker.total_remaining();

    // Phase 1: best fit for the whole duration.
    std::vector<const ScoredTask*> pending;
    for (const auto& t : ordered) {
        int minutes = t.task.estimated_duration_minutes;
        auto w = best_fit(tracker, minutes);
        if (!w) {
            pending.push_back(&t);
            continue;
        }
        tracker.consume(*w, minutes);
        assign(items[t.input_index], *w, minutes, ItemStatus::COMPLETE, kPerfectFitConfidence,
               "Perfect fit in " + std::to_string(tracker.state(*w).duration_minutes) + "-minute slot");
    }
    reporting::debug("allocator", "phase 1 placed " + std::to_string(ordered.size() - pending.size())
                     + "/" + std::to_string(ordered.size()) + " tasks");

    // Phase 2: largest remaining window, possibly short.
    size_t phase2_placed = 0;
    for (const auto* t : pending) {
        auto& item = items[t->input_index];
        auto w = largest_window(tracker);
        if (!w) {
            item.status = ItemStatus::NOT_SCHEDULED;
            item.confidence = 0.0;
            item.notes = {kNoSlotNote};
            continue;
        }
        int wanted = t->task.estimated_duration_minutes;
        int minutes = std::min(wanted, tracker.remaining(*w));
        tracker.consume(*w, minutes, opts_.partial_fit_floor);
        ++phase2_placed;
        if (minutes < wanted) {
            assign(item, *w, minutes, ItemStatus::PARTIAL, kPartialConfidence,
                   "Partial scheduling: " + std::to_string(minutes) + " of " + std::to_string(wanted) + " minutes");
        } else {
            assign(item, *w, minutes, overcommitted ? ItemStatus::SCALED : ItemStatus::COMPLETE, kFitConfidence,
                   "Scheduled in available " + std::to_string(minutes) + "-minute slot");
        }
    }
    reporting::debug("allocator", "phase 2 placed " + std::to_string(phase2_placed) + "/"
                     + std::to_string(pending.size()) + " remaining tasks");

    // Phase 3: squeeze high-priority or urgent leftovers into any scrap of time.
    size_t rescued = 0;
    for (const auto& t : ordered) {
        auto& item = items[t.input_index];
        if (item.status != ItemStatus::NOT_SCHEDULED || !rescuable(t)) continue;
        auto w = first_usable(tracker);
        if (!w) continue;
        int wanted = t.task.estimated_duration_minutes;
        int minutes = std::min(wanted, tracker.remaining(*w));
        tracker.consume(*w, minutes, opts_.rescue_floor);
        ++rescued;
        assign(item, *w, minutes, minutes < wanted ? ItemStatus::PARTIAL : ItemStatus::SCALED, kRescueConfidence,
               "Emergency scheduling: " + std::to_string(minutes) + " minutes for high-priority task");
    }
    if (rescued > 0) reporting::debug("allocator", "phase 3 rescued " + std::to_string(rescued) + " tasks");

    return items;
}

std::unique_ptr<Allocator> make_greedy_allocator(SchedulerOptions opts) {
    return std::make_unique<GreedyAllocator>(opts);
}

} // namespace stressched

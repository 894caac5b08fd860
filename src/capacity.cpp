#include "stressched/capacity.hpp"

#include <stdexcept>
#include <string>

namespace stressched {

CapacityTracker::CapacityTracker(const std::vector<TimeWindow>& windows) {
    windows_.reserve(windows.size());
    for (const auto& w : windows) {
        WindowState s;
        s.duration_minutes = w.duration_minutes();
        s.remaining_minutes = s.duration_minutes;
        s.exhausted = s.remaining_minutes == 0;
        windows_.push_back(s);
    }
}

void CapacityTracker::consume(size_t index, int minutes, int floor) {
    auto& w = windows_.at(index);
    if (minutes < 0 || minutes > w.remaining_minutes) {
        throw std::logic_error("capacity: cannot consume " + std::to_string(minutes) + " of "
                               + std::to_string(w.remaining_minutes) + " remaining minutes in window "
                               + std::to_string(index));
    }
    w.remaining_minutes -= minutes;
    if (w.remaining_minutes == 0 || w.remaining_minutes < floor) w.exhausted = true;
}

int CapacityTracker::remaining(size_t index) const {
    return windows_.at(index).remaining_minutes;
}

bool CapacityTracker::exhausted(size_t index) const {
    return windows_.at(index).exhausted;
}

bool CapacityTracker::usable(size_t index, int min_remaining) const {
    const auto& w = windows_.at(index);
    return !w.exhausted && w.remaining_minutes >= min_remaining;
}

const WindowState& CapacityTracker::state(size_t index) const {
    return windows_.at(index);
}

int CapacityTracker::total_capacity() const {
    int total = 0;
    for (const auto& w : windows_) total += w.duration_minutes;
    return total;
}

int CapacityTracker::total_remaining() const {
    int total = 0;
    for (const auto& w : windows_) total += w.remaining_minutes;
    return total;
}

} // namespace stressched

#pragma once
#include "task.hpp"
#include <cstddef>
#include <vector>

namespace stressched {

struct WindowState {
    int duration_minutes{0};
    int remaining_minutes{0};
    bool exhausted{false};
};

// Remaining capacity per window, indexed by the window's input position.
// One tracker belongs to exactly one scheduling call.
class CapacityTracker {
public:
    explicit CapacityTracker(const std::vector<TimeWindow>& windows);

    // `minutes` must not exceed the remaining capacity. The window is marked
    // exhausted once it reaches zero or drops under `floor`.
    void consume(size_t index, int minutes, int floor = 0);

    int remaining(size_t index) const;
    bool exhausted(size_t index) const;
    bool usable(size_t index, int min_remaining) const;
    const WindowState& state(size_t index) const;
    size_t size() const { return windows_.size(); }
    int total_capacity() const;
    int total_remaining() const;

private:
    std::vector<WindowState> windows_;
};

} // namespace stressched

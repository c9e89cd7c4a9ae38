#pragma once

#include <optional>
#include <vector>
#include "bar.hpp"

namespace crossover_sim {

struct MovingAverages {
    std::optional<double> fast;
    std::optional<double> slow;

    bool defined() const { return fast.has_value() && slow.has_value(); }
};

/**
 * Simple moving average over a fixed window.
 * Fixed-capacity circular buffer with a running sum; O(1) per update.
 */
class RollingMean {
public:
    explicit RollingMean(size_t window);

    void push(double value);
    void reset();

    // Mean of the last `window` values, nullopt until the window is full.
    std::optional<double> value() const;

    size_t window() const { return window_; }
    size_t count() const { return count_; }
    bool ready() const { return count_ >= window_; }

private:
    size_t window_;
    std::vector<double> buffer_;
    size_t head_{0};
    size_t count_{0};
    double sum_{0.0};
};

/**
 * Fast and slow simple moving averages of bar closes.
 */
class MovingAverageTracker {
public:
    MovingAverageTracker(size_t fast_window, size_t slow_window);

    MovingAverages update(const Bar& bar);
    MovingAverages current() const;
    void reset();

    size_t bars_seen() const { return slow_.count(); }

private:
    RollingMean fast_;
    RollingMean slow_;
};

} // namespace crossover_sim

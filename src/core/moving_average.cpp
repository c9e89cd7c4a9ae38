#include "moving_average.hpp"
#include <algorithm>

namespace crossover_sim {

RollingMean::RollingMean(size_t window)
    : window_(window), buffer_(window, 0.0) {}

void RollingMean::push(double value) {
    if (window_ == 0) return;
    if (count_ >= window_) {
        sum_ -= buffer_[head_];
    }
    buffer_[head_] = value;
    sum_ += value;
    head_ = (head_ + 1) % window_;
    ++count_;
    // Re-sum once per cycle to bound drift in the running sum.
    if (head_ == 0 && count_ > window_) {
        double s = 0.0;
        for (double v : buffer_) s += v;
        sum_ = s;
    }
}

void RollingMean::reset() {
    std::fill(buffer_.begin(), buffer_.end(), 0.0);
    head_ = 0;
    count_ = 0;
    sum_ = 0.0;
}

std::optional<double> RollingMean::value() const {
    if (window_ == 0 || count_ < window_) return std::nullopt;
    return sum_ / static_cast<double>(window_);
}

MovingAverageTracker::MovingAverageTracker(size_t fast_window, size_t slow_window)
    : fast_(fast_window), slow_(slow_window) {}

MovingAverages MovingAverageTracker::update(const Bar& bar) {
    fast_.push(bar.close);
    slow_.push(bar.close);
    return current();
}

MovingAverages MovingAverageTracker::current() const {
    return MovingAverages{fast_.value(), slow_.value()};
}

void MovingAverageTracker::reset() {
    fast_.reset();
    slow_.reset();
}

} // namespace crossover_sim

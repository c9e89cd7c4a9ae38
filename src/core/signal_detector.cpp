#include "signal_detector.hpp"

namespace crossover_sim {

Signal classify_crossover(const MovingAverages& prev, const MovingAverages& curr) {
    if (!prev.defined() || !curr.defined()) return Signal::NONE;
    double prev_diff = *prev.fast - *prev.slow;
    double curr_diff = *curr.fast - *curr.slow;
    if (prev_diff <= 0.0 && curr_diff > 0.0) return Signal::BUY;
    if (prev_diff >= 0.0 && curr_diff < 0.0) return Signal::SELL;
    return Signal::NONE;
}

Signal SignalDetector::detect(const MovingAverages& prev, const MovingAverages& curr) {
    if (!curr.defined()) return Signal::NONE;

    Signal s = classify_crossover(prev, curr);
    if (s == Signal::BUY && last_side_ > 0) s = Signal::NONE;
    if (s == Signal::SELL && last_side_ < 0) s = Signal::NONE;

    double curr_diff = *curr.fast - *curr.slow;
    if (curr_diff > 0.0) {
        last_side_ = 1;
    } else if (curr_diff < 0.0) {
        last_side_ = -1;
    }
    return s;
}

} // namespace crossover_sim

#pragma once

#include <string>
#include "moving_average.hpp"

namespace crossover_sim {

enum class Signal { NONE, BUY, SELL };

inline const char* to_string(Signal s) {
    switch (s) {
        case Signal::BUY:  return "BUY";
        case Signal::SELL: return "SELL";
        default:           return "NONE";
    }
}

/**
 * Stateless crossover rule on two consecutive fast/slow readings.
 * BUY when fast - slow goes from <= 0 to > 0, SELL when it goes from >= 0 to < 0.
 * NONE if any of the four averages is still warming up.
 */
Signal classify_crossover(const MovingAverages& prev, const MovingAverages& curr);

/**
 * Golden cross / death cross detector.
 *
 * Applies classify_crossover and additionally remembers the side of the last
 * non-zero fast - slow difference, so a difference that touches zero and returns
 * to the same side does not fire a second signal for the same crossover.
 */
class SignalDetector {
public:
    Signal detect(const MovingAverages& prev, const MovingAverages& curr);
    void reset() { last_side_ = 0; }

    // +1 fast above slow, -1 below, 0 no non-zero difference seen yet.
    int last_side() const { return last_side_; }

private:
    int last_side_{0};
};

} // namespace crossover_sim

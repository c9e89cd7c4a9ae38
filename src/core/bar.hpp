#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace crossover_sim {

using Timestamp = std::chrono::system_clock::time_point;

struct Bar {
    Timestamp timestamp;
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

/**
 * Time-ordered daily bars for a single instrument.
 * Immutable once constructed; timestamps must be strictly increasing.
 */
class PriceSeries {
public:
    PriceSeries() = default;

    // Throws InvalidPriceSeries if a timestamp does not follow its predecessor.
    explicit PriceSeries(std::vector<Bar> bars);

    const std::vector<Bar>& bars() const { return bars_; }
    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& at(size_t i) const { return bars_.at(i); }

    std::vector<Bar>::const_iterator begin() const { return bars_.begin(); }
    std::vector<Bar>::const_iterator end() const { return bars_.end(); }

private:
    std::vector<Bar> bars_;
};

} // namespace crossover_sim

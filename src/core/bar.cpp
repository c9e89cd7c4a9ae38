#include "bar.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <utility>

namespace crossover_sim {

PriceSeries::PriceSeries(std::vector<Bar> bars) : bars_(std::move(bars)) {
    for (size_t i = 1; i < bars_.size(); ++i) {
        if (bars_[i].timestamp <= bars_[i - 1].timestamp) {
            throw InvalidPriceSeries("bar " + std::to_string(i) + " at " +
                                     utils::ts_to_date(bars_[i].timestamp) +
                                     " does not follow " +
                                     utils::ts_to_date(bars_[i - 1].timestamp));
        }
    }
}

} // namespace crossover_sim

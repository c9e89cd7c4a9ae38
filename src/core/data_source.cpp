#include "data_source.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

namespace crossover_sim {

PriceSeries load_price_series(DataSource& source,
                              const std::string& symbol,
                              std::optional<Timestamp> start_time,
                              std::optional<Timestamp> end_time) {
    std::vector<Bar> bars;
    {
        DataSourceSession session(source);
        bars = session.source().get_bars(symbol, start_time, end_time);
    }
    if (bars.empty()) {
        throw InsufficientData("no bars available for " + symbol);
    }
    spdlog::info("Loaded {} bars for {} ({} .. {})", bars.size(), symbol,
                 utils::ts_to_date(bars.front().timestamp),
                 utils::ts_to_date(bars.back().timestamp));
    return PriceSeries(std::move(bars));
}

} // namespace crossover_sim

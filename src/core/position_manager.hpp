#pragma once

#include <optional>
#include <vector>
#include "bar.hpp"
#include "config.hpp"
#include "performance.hpp"
#include "signal_detector.hpp"
#include "trade.hpp"

namespace crossover_sim {

/**
 * Long-only, single-position execution against bar closes.
 *
 * BUY opens a position if flat (fully invested unless a fixed size is configured),
 * SELL closes it if open. Everything else is a no-op: no pyramiding, no shorting.
 * Cash moves through the PortfolioAccountant.
 */
class PositionManager {
public:
    PositionManager(PortfolioAccountant& portfolio, const AccountConfig& config);

    // Returns the closed trade when the signal closes a position.
    std::optional<Trade> on_signal(Signal signal, const Bar& bar);

    // Close any open position at the bar's close; used once the series is exhausted.
    std::optional<Trade> force_close(const Bar& bar);

    const std::optional<Position>& position() const { return position_; }
    bool has_position() const { return position_.has_value(); }

    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<TradeMarker>& markers() const { return markers_; }
    double total_commission() const { return total_commission_; }

private:
    void open(const Bar& bar);
    Trade close(const Bar& bar, bool forced);

    PortfolioAccountant& portfolio_;
    AccountConfig config_;
    std::optional<Position> position_;
    std::vector<Trade> trades_;
    std::vector<TradeMarker> markers_;
    double total_commission_{0.0};
};

} // namespace crossover_sim

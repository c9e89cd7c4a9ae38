#pragma once

#include <optional>
#include <vector>
#include "bar.hpp"
#include "trade.hpp"

namespace crossover_sim {

constexpr double kTradingDaysPerYear = 252.0;

struct EquityPoint {
    Timestamp timestamp;
    double equity;
};

struct PerformanceMetrics {
    double starting_value{0.0};
    double ending_value{0.0};
    double total_return{0.0};
    double annualized_return{0.0};
    double max_drawdown{0.0};
    size_t max_drawdown_duration{0};        // bars spent below the running peak
    double sharpe{0.0};
    size_t total_trades{0};
    size_t winning_trades{0};
    size_t losing_trades{0};
    std::optional<double> win_rate;         // absent without closed trades
    double average_win{0.0};
    double average_loss{0.0};
    double total_pnl{0.0};
    double total_commission{0.0};
};

/**
 * Computes all metrics from a recorded equity curve and trade list.
 * Zero denominators yield 0 (or an absent win rate), never NaN.
 */
PerformanceMetrics compute_metrics(double initial_cash,
                                   const std::vector<EquityPoint>& series,
                                   const std::vector<Trade>& trades);

/**
 * Cash ledger and equity curve of the single-instrument portfolio.
 */
class PortfolioAccountant {
public:
    explicit PortfolioAccountant(double initial_cash);

    double initial_cash() const { return initial_cash_; }
    double cash() const { return cash_; }

    void debit(double amount) { cash_ -= amount; }
    void credit(double amount) { cash_ += amount; }

    // Mark the portfolio at the bar's close and append one equity point.
    double mark(const Bar& bar, const std::optional<Position>& position);

    // Append a point; a point with the timestamp of the last one replaces it.
    void record(Timestamp ts, double equity);

    const std::vector<EquityPoint>& equity_curve() const { return series_; }
    std::vector<EquityPoint> points(size_t limit = 0) const;
    PerformanceMetrics metrics(const std::vector<Trade>& trades) const;

private:
    double initial_cash_;
    double cash_;
    std::vector<EquityPoint> series_;
};

} // namespace crossover_sim

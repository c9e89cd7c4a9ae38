#pragma once

#include <optional>
#include <vector>
#include "bar.hpp"
#include "config.hpp"
#include "moving_average.hpp"
#include "performance.hpp"
#include "position_manager.hpp"
#include "signal_detector.hpp"
#include "trade.hpp"

namespace crossover_sim {

enum class EnginePhase { WARMUP, ACTIVE, FINALIZE };

inline const char* to_string(EnginePhase p) {
    switch (p) {
        case EnginePhase::WARMUP:   return "WARMUP";
        case EnginePhase::ACTIVE:   return "ACTIVE";
        default:                    return "FINALIZE";
    }
}

/**
 * Plain series for the chart renderer, aligned index-for-index with bars.
 */
struct ChartData {
    std::vector<Bar> bars;
    std::vector<std::optional<double>> fast_ma;
    std::vector<std::optional<double>> slow_ma;
    std::vector<TradeMarker> markers;
};

struct BacktestReport {
    StrategyConfig strategy;
    PerformanceMetrics metrics;
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    ChartData chart;
    size_t buy_signals{0};
    size_t sell_signals{0};
};

/**
 * Bar-by-bar dual moving-average crossover backtest.
 *
 * WARMUP until slow_window bars have been seen, then ACTIVE. finalize() closes any
 * open position at the last close and produces the report; it runs exactly once and
 * the engine accepts no further bars afterwards.
 */
class BacktestEngine {
public:
    // Throws InvalidConfiguration before any bar is processed.
    BacktestEngine(const StrategyConfig& strategy, const AccountConfig& account);

    BacktestEngine(const BacktestEngine&) = delete;
    BacktestEngine& operator=(const BacktestEngine&) = delete;

    // Process every bar, then finalize. Throws InsufficientData on an empty series.
    BacktestReport run(const PriceSeries& series);

    void on_bar(const Bar& bar);
    BacktestReport finalize();

    EnginePhase phase() const { return phase_; }
    size_t bars_processed() const { return bars_processed_; }
    const PositionManager& positions() const { return positions_; }

private:
    StrategyConfig strategy_;
    AccountConfig account_;
    MovingAverageTracker tracker_;
    SignalDetector detector_;
    PortfolioAccountant portfolio_;
    PositionManager positions_;

    EnginePhase phase_{EnginePhase::WARMUP};
    MovingAverages prev_;
    std::optional<Bar> last_bar_;
    size_t bars_processed_{0};
    size_t buy_signals_{0};
    size_t sell_signals_{0};
    ChartData chart_;
};

} // namespace crossover_sim

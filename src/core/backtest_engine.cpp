#include "backtest_engine.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace crossover_sim {

namespace {

const StrategyConfig& checked(const StrategyConfig& cfg) {
    validate(cfg);
    return cfg;
}

const AccountConfig& checked(const AccountConfig& cfg) {
    validate(cfg);
    return cfg;
}

} // namespace

BacktestEngine::BacktestEngine(const StrategyConfig& strategy, const AccountConfig& account)
    : strategy_(checked(strategy)),
      account_(checked(account)),
      tracker_(static_cast<size_t>(strategy_.fast_window), static_cast<size_t>(strategy_.slow_window)),
      portfolio_(account_.initial_cash),
      positions_(portfolio_, account_) {}

BacktestReport BacktestEngine::run(const PriceSeries& series) {
    if (series.empty()) {
        throw InsufficientData("price series contains no bars");
    }
    if (bars_processed_ != 0 || phase_ == EnginePhase::FINALIZE) {
        throw std::logic_error("run() requires an engine that has not processed any bars");
    }
    spdlog::info("Backtest starting: {} bars {} .. {}, fast={} slow={} cash={:.2f} commission={} ({})",
                 series.size(),
                 utils::ts_to_date(series.bars().front().timestamp),
                 utils::ts_to_date(series.bars().back().timestamp),
                 strategy_.fast_window, strategy_.slow_window, account_.initial_cash,
                 account_.commission.rate, to_string(account_.commission.legs));
    if (series.size() < static_cast<size_t>(strategy_.slow_window)) {
        spdlog::warn("Series has {} bars, fewer than slow_window={}; no signals can fire",
                     series.size(), strategy_.slow_window);
    }

    chart_.bars.reserve(series.size());
    chart_.fast_ma.reserve(series.size());
    chart_.slow_ma.reserve(series.size());
    for (const auto& bar : series) {
        on_bar(bar);
    }
    return finalize();
}

void BacktestEngine::on_bar(const Bar& bar) {
    if (phase_ == EnginePhase::FINALIZE) {
        throw std::logic_error("bar received after the backtest was finalized");
    }
    if (last_bar_ && bar.timestamp <= last_bar_->timestamp) {
        throw InvalidPriceSeries("bar at " + utils::ts_to_date(bar.timestamp) +
                                 " does not follow " + utils::ts_to_date(last_bar_->timestamp));
    }

    MovingAverages curr = tracker_.update(bar);
    ++bars_processed_;

    if (phase_ == EnginePhase::WARMUP && bars_processed_ >= static_cast<size_t>(strategy_.slow_window)) {
        phase_ = EnginePhase::ACTIVE;
        spdlog::info("Phase {} -> {} on {} after {} bars", to_string(EnginePhase::WARMUP),
                     to_string(phase_), utils::ts_to_date(bar.timestamp), bars_processed_);
    }

    Signal signal = Signal::NONE;
    if (phase_ == EnginePhase::ACTIVE) {
        signal = detector_.detect(prev_, curr);
    }
    if (signal == Signal::BUY) ++buy_signals_;
    if (signal == Signal::SELL) ++sell_signals_;
    if (signal != Signal::NONE) {
        spdlog::debug("{} signal on {} fast={:.4f} slow={:.4f}", to_string(signal),
                      utils::ts_to_date(bar.timestamp), curr.fast.value_or(0.0), curr.slow.value_or(0.0));
    }

    positions_.on_signal(signal, bar);
    portfolio_.mark(bar, positions_.position());

    chart_.bars.push_back(bar);
    chart_.fast_ma.push_back(curr.fast);
    chart_.slow_ma.push_back(curr.slow);

    prev_ = curr;
    last_bar_ = bar;
}

BacktestReport BacktestEngine::finalize() {
    if (phase_ == EnginePhase::FINALIZE) {
        throw std::logic_error("backtest already finalized");
    }
    if (!last_bar_) {
        throw InsufficientData("cannot finalize a backtest that processed no bars");
    }
    phase_ = EnginePhase::FINALIZE;

    if (positions_.force_close(*last_bar_)) {
        // Replace the final equity point with the post-close cash balance.
        portfolio_.mark(*last_bar_, positions_.position());
    }

    BacktestReport report;
    report.strategy = strategy_;
    report.trades = positions_.trades();
    report.equity_curve = portfolio_.equity_curve();
    report.metrics = portfolio_.metrics(report.trades);
    report.buy_signals = buy_signals_;
    report.sell_signals = sell_signals_;
    chart_.markers = positions_.markers();
    report.chart = chart_;

    spdlog::info("Backtest finished: {} bars, {} trades, ending value {:.2f}",
                 bars_processed_, report.metrics.total_trades, report.metrics.ending_value);
    return report;
}

} // namespace crossover_sim

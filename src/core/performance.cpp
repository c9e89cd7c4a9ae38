#include "performance.hpp"
#include <algorithm>
#include <cmath>

namespace crossover_sim {

namespace {

void apply_drawdown(const std::vector<EquityPoint>& series, PerformanceMetrics& out) {
    if (series.empty()) return;
    double peak = series.front().equity;
    double max_dd = 0.0;
    size_t run = 0;
    size_t max_run = 0;
    for (const auto& p : series) {
        if (p.equity >= peak) {
            peak = p.equity;
            run = 0;
            continue;
        }
        ++run;
        if (run > max_run) max_run = run;
        double dd = peak > 0.0 ? (peak - p.equity) / peak : 0.0;
        if (dd > max_dd) max_dd = dd;
    }
    out.max_drawdown = std::min(max_dd, 1.0);
    out.max_drawdown_duration = max_run;
}

void apply_sharpe(const std::vector<EquityPoint>& series, PerformanceMetrics& out) {
    if (series.size() < 2) return;
    std::vector<double> rets;
    rets.reserve(series.size() - 1);
    for (size_t i = 1; i < series.size(); ++i) {
        double prev = series[i - 1].equity;
        double cur = series[i].equity;
        if (prev != 0.0) rets.push_back((cur - prev) / prev);
    }
    if (rets.size() < 2) return;
    double mean = 0.0;
    for (double r : rets) mean += r;
    mean /= static_cast<double>(rets.size());
    double var = 0.0;
    for (double r : rets) {
        double d = r - mean;
        var += d * d;
    }
    var /= static_cast<double>(rets.size() - 1);
    double stddev = std::sqrt(var);
    if (stddev > 0.0 && std::isfinite(stddev)) {
        out.sharpe = mean / stddev * std::sqrt(kTradingDaysPerYear);
    }
}

void apply_trade_stats(const std::vector<Trade>& trades, PerformanceMetrics& out) {
    out.total_trades = trades.size();
    double won_pnl = 0.0;
    double lost_pnl = 0.0;
    for (const auto& t : trades) {
        out.total_pnl += t.pnl;
        out.total_commission += t.commission;
        // Wins and losses are classified on gross pnl; their averages are net of commission.
        if (t.pnl > 0.0) {
            ++out.winning_trades;
            won_pnl += t.net_pnl();
        } else if (t.pnl < 0.0) {
            ++out.losing_trades;
            lost_pnl += t.net_pnl();
        }
    }
    if (out.total_trades > 0) {
        out.win_rate = static_cast<double>(out.winning_trades) / static_cast<double>(out.total_trades);
    }
    if (out.winning_trades > 0) out.average_win = won_pnl / static_cast<double>(out.winning_trades);
    if (out.losing_trades > 0) out.average_loss = lost_pnl / static_cast<double>(out.losing_trades);
}

} // namespace

PerformanceMetrics compute_metrics(double initial_cash,
                                   const std::vector<EquityPoint>& series,
                                   const std::vector<Trade>& trades) {
    PerformanceMetrics out;
    out.starting_value = initial_cash;
    out.ending_value = series.empty() ? initial_cash : series.back().equity;

    if (initial_cash > 0.0) {
        double growth = out.ending_value / initial_cash;
        out.total_return = growth - 1.0;
        if (!series.empty() && growth > 0.0) {
            out.annualized_return =
                std::pow(growth, kTradingDaysPerYear / static_cast<double>(series.size())) - 1.0;
        } else if (!series.empty()) {
            out.annualized_return = -1.0;
        }
    }

    apply_drawdown(series, out);
    apply_sharpe(series, out);
    apply_trade_stats(trades, out);
    return out;
}

PortfolioAccountant::PortfolioAccountant(double initial_cash)
    : initial_cash_(initial_cash), cash_(initial_cash) {}

double PortfolioAccountant::mark(const Bar& bar, const std::optional<Position>& position) {
    double equity = cash_;
    if (position) equity += position->size * bar.close;
    record(bar.timestamp, equity);
    return equity;
}

void PortfolioAccountant::record(Timestamp ts, double equity) {
    if (!series_.empty() && series_.back().timestamp == ts) {
        series_.back().equity = equity;
        return;
    }
    series_.push_back({ts, equity});
}

std::vector<EquityPoint> PortfolioAccountant::points(size_t limit) const {
    if (limit == 0 || series_.size() <= limit) return series_;
    return std::vector<EquityPoint>(series_.end() - limit, series_.end());
}

PerformanceMetrics PortfolioAccountant::metrics(const std::vector<Trade>& trades) const {
    return compute_metrics(initial_cash_, series_, trades);
}

} // namespace crossover_sim

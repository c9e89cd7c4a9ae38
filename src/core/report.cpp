#include "report.hpp"
#include "utils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>

namespace crossover_sim {

namespace {

nlohmann::json optional_to_json(const std::optional<double>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

bool open_output(std::ofstream& out, const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create directory {}: {}", p.parent_path().string(), ec.message());
            return false;
        }
    }
    out.open(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        spdlog::error("Cannot open {} for writing", path);
        return false;
    }
    return true;
}

bool finish_output(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) {
        spdlog::error("Write to {} failed", path);
        return false;
    }
    spdlog::info("Wrote {}", path);
    return true;
}

} // namespace

nlohmann::json trade_to_json(const Trade& trade) {
    return {
        {"entry_time", utils::ts_to_date(trade.entry_time)},
        {"exit_time", utils::ts_to_date(trade.exit_time)},
        {"entry_price", trade.entry_price},
        {"exit_price", trade.exit_price},
        {"size", trade.size},
        {"pnl", trade.pnl},
        {"commission", trade.commission},
        {"net_pnl", trade.net_pnl()},
        {"return_pct", trade.return_pct()},
        {"forced_exit", trade.forced_exit}
    };
}

nlohmann::json metrics_to_json(const PerformanceMetrics& m) {
    return {
        {"starting_value", m.starting_value},
        {"ending_value", m.ending_value},
        {"total_return", m.total_return},
        {"annualized_return", m.annualized_return},
        {"sharpe_ratio", m.sharpe},
        {"max_drawdown", m.max_drawdown},
        {"max_drawdown_duration", m.max_drawdown_duration},
        {"total_trades", m.total_trades},
        {"winning_trades", m.winning_trades},
        {"losing_trades", m.losing_trades},
        {"win_rate", optional_to_json(m.win_rate)},
        {"average_win", m.average_win},
        {"average_loss", m.average_loss},
        {"total_pnl", m.total_pnl},
        {"total_commission", m.total_commission}
    };
}

nlohmann::json report_to_json(const BacktestReport& report) {
    nlohmann::json j = metrics_to_json(report.metrics);
    j["fast_window"] = report.strategy.fast_window;
    j["slow_window"] = report.strategy.slow_window;
    j["buy_signals"] = report.buy_signals;
    j["sell_signals"] = report.sell_signals;

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& t : report.trades) trades.push_back(trade_to_json(t));
    j["trade_list"] = std::move(trades);

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& p : report.equity_curve) {
        curve.push_back({{"timestamp", utils::ts_to_date(p.timestamp)}, {"equity", p.equity}});
    }
    j["equity_curve"] = std::move(curve);
    return j;
}

nlohmann::json chart_to_json(const ChartData& chart, const std::string& symbol) {
    nlohmann::json bars = nlohmann::json::array();
    for (size_t i = 0; i < chart.bars.size(); ++i) {
        const auto& b = chart.bars[i];
        bars.push_back({
            {"t", utils::ts_to_ms(b.timestamp)},
            {"o", b.open},
            {"h", b.high},
            {"l", b.low},
            {"c", b.close},
            {"v", b.volume},
            {"fast_ma", i < chart.fast_ma.size() ? optional_to_json(chart.fast_ma[i]) : nlohmann::json(nullptr)},
            {"slow_ma", i < chart.slow_ma.size() ? optional_to_json(chart.slow_ma[i]) : nlohmann::json(nullptr)}
        });
    }
    nlohmann::json markers = nlohmann::json::array();
    for (const auto& m : chart.markers) {
        markers.push_back({
            {"t", utils::ts_to_ms(m.timestamp)},
            {"price", m.price},
            {"side", to_string(m.side)}
        });
    }
    return {
        {"symbol", symbol},
        {"bars", std::move(bars)},
        {"markers", std::move(markers)}
    };
}

bool write_report_json(const BacktestReport& report, const std::string& path) {
    std::ofstream out;
    if (!open_output(out, path)) return false;
    out << report_to_json(report).dump(2) << "\n";
    return finish_output(out, path);
}

bool write_trade_log_csv(const std::vector<Trade>& trades, const std::string& path) {
    std::ofstream out;
    if (!open_output(out, path)) return false;
    out << "entry_time,exit_time,entry_price,exit_price,size,pnl,commission,net_pnl,forced_exit\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& t : trades) {
        out << utils::ts_to_date(t.entry_time) << ','
            << utils::ts_to_date(t.exit_time) << ','
            << t.entry_price << ','
            << t.exit_price << ','
            << t.size << ','
            << t.pnl << ','
            << t.commission << ','
            << t.net_pnl() << ','
            << (t.forced_exit ? "true" : "false") << '\n';
    }
    return finish_output(out, path);
}

bool write_equity_curve_csv(const std::vector<EquityPoint>& curve, const std::string& path) {
    std::ofstream out;
    if (!open_output(out, path)) return false;
    out << "timestamp,equity\n";
    out << std::fixed << std::setprecision(2);
    for (const auto& p : curve) {
        out << utils::ts_to_date(p.timestamp) << ',' << p.equity << '\n';
    }
    return finish_output(out, path);
}

bool write_chart_json(const ChartData& chart, const std::string& symbol, const std::string& path) {
    std::ofstream out;
    if (!open_output(out, path)) return false;
    out << chart_to_json(chart, symbol).dump() << "\n";
    return finish_output(out, path);
}

void print_summary(const BacktestReport& report) {
    const auto& m = report.metrics;
    spdlog::info("Starting Portfolio Value: {:.2f}", m.starting_value);
    spdlog::info("Ending Portfolio Value: {:.2f}", m.ending_value);
    spdlog::info("Total Profit/Loss: {:.2f}", m.ending_value - m.starting_value);
    spdlog::info("--- Backtesting Results ---");
    spdlog::info("Sharpe Ratio: {:.2f}", m.sharpe);
    spdlog::info("Max Drawdown: {:.2f}%", m.max_drawdown * 100.0);
    spdlog::info("Max Drawdown Duration: {} days", m.max_drawdown_duration);
    spdlog::info("Total Returns: {:.2f}%", m.total_return * 100.0);
    spdlog::info("Annualized Returns: {:.2f}%", m.annualized_return * 100.0);

    if (m.total_trades == 0) {
        spdlog::info("No trades closed during the backtest period.");
        return;
    }
    spdlog::info("--- Trade Statistics ---");
    spdlog::info("Total Trades: {}", m.total_trades);
    spdlog::info("Wins: {}", m.winning_trades);
    spdlog::info("Losses: {}", m.losing_trades);
    spdlog::info("Win Rate: {:.2f}%", m.win_rate.value_or(0.0) * 100.0);
    if (m.winning_trades > 0) spdlog::info("Average Win: {:.2f}", m.average_win);
    if (m.losing_trades > 0) spdlog::info("Average Loss: {:.2f}", m.average_loss);
    spdlog::info("Total Commission: {:.2f}", m.total_commission);
    if (!report.trades.empty() && report.trades.back().forced_exit) {
        spdlog::info("Last trade closed at end of data on {}",
                     utils::ts_to_date(report.trades.back().exit_time));
    }
}

} // namespace crossover_sim

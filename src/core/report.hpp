#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backtest_engine.hpp"

namespace crossover_sim {

nlohmann::json trade_to_json(const Trade& trade);
nlohmann::json metrics_to_json(const PerformanceMetrics& m);
nlohmann::json report_to_json(const BacktestReport& report);

// Bars, both moving-average series and fill markers for the chart viewer.
nlohmann::json chart_to_json(const ChartData& chart, const std::string& symbol);

// Writers log and return false on I/O failure; parent directories are created.
bool write_report_json(const BacktestReport& report, const std::string& path);
bool write_trade_log_csv(const std::vector<Trade>& trades, const std::string& path);
bool write_equity_curve_csv(const std::vector<EquityPoint>& curve, const std::string& path);
bool write_chart_json(const ChartData& chart, const std::string& symbol, const std::string& path);

// Human-readable summary through the logger.
void print_summary(const BacktestReport& report);

} // namespace crossover_sim

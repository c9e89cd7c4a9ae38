#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/backtest_engine.hpp"
#include "core/config.hpp"
#include "core/data_source_csv.hpp"
#include "core/report.hpp"
#include "core/utils.hpp"

namespace {

void setup_logging(const crossover_sim::LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, true));
    }
    auto logger = std::make_shared<spdlog::logger>("crossover_sim", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(cfg.level));
}

std::optional<crossover_sim::Timestamp> parse_bound(const std::string& s, const char* name) {
    if (s.empty()) return std::nullopt;
    auto ts = crossover_sim::utils::parse_ts_any(s);
    if (!ts) {
        throw crossover_sim::InvalidConfiguration(std::string("cannot parse data.") + name + " '" + s + "'");
    }
    return ts;
}

void write_outputs(const crossover_sim::Config& cfg, const crossover_sim::BacktestReport& report) {
    namespace fs = std::filesystem;
    const fs::path dir(cfg.output.directory);
    const auto& symbol = cfg.data.symbol;
    bool ok = true;
    if (cfg.output.write_report) {
        ok &= crossover_sim::write_report_json(report, (dir / "report.json").string());
    }
    if (cfg.output.write_trade_log) {
        ok &= crossover_sim::write_trade_log_csv(report.trades, (dir / "trades.csv").string());
    }
    if (cfg.output.write_equity_curve) {
        ok &= crossover_sim::write_equity_curve_csv(report.equity_curve, (dir / "equity_curve.csv").string());
    }
    if (cfg.output.write_chart) {
        ok &= crossover_sim::write_chart_json(report.chart, symbol, (dir / "chart.json").string());
    }
    if (!ok) {
        spdlog::warn("Some output files could not be written to {}", dir.string());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    std::string csv_override;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--csv" && i + 1 < argc) {
            csv_override = argv[++i];
        } else {
            config_path = arg;
        }
    }

    try {
        crossover_sim::Config cfg;
        crossover_sim::load_config(cfg, config_path);
        if (!csv_override.empty()) cfg.data.csv_path = csv_override;
        setup_logging(cfg.logging);

        spdlog::info("Crossover simulator starting. symbol={} data={} fast={} slow={}",
                     cfg.data.symbol, cfg.data.csv_path,
                     cfg.strategy.fast_window, cfg.strategy.slow_window);

        // Reject bad settings before touching the data.
        crossover_sim::BacktestEngine engine(cfg.strategy, cfg.account);

        crossover_sim::CsvDataSource source(cfg.data.csv_path);
        auto series = crossover_sim::load_price_series(source, cfg.data.symbol,
                                                       parse_bound(cfg.data.start, "start"),
                                                       parse_bound(cfg.data.end, "end"));

        auto report = engine.run(series);
        crossover_sim::print_summary(report);
        write_outputs(cfg, report);
    } catch (const std::exception& e) {
        spdlog::error("Backtest failed: {}", e.what());
        return 1;
    }
    return 0;
}

#pragma once

#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace crossover_sim {

using json = nlohmann::json;

struct StrategyConfig {
    int fast_window{50};
    int slow_window{200};
};

/**
 * Which legs of a round trip pay commission.
 */
enum class CommissionLegs { BOTH, ENTRY, EXIT };

inline std::string to_string(CommissionLegs legs) {
    switch (legs) {
        case CommissionLegs::ENTRY: return "entry";
        case CommissionLegs::EXIT:  return "exit";
        default:                    return "both";
    }
}

inline CommissionLegs parse_commission_legs(const std::string& s) {
    if (s == "both") return CommissionLegs::BOTH;
    if (s == "entry") return CommissionLegs::ENTRY;
    if (s == "exit") return CommissionLegs::EXIT;
    throw InvalidConfiguration("commission_legs must be one of both|entry|exit, got '" + s + "'");
}

struct CommissionConfig {
    double rate{0.0};                       // fraction of notional, e.g. 0.001 = 0.1%
    CommissionLegs legs{CommissionLegs::BOTH};

    double entry_rate() const {
        return legs == CommissionLegs::EXIT ? 0.0 : rate;
    }

    double exit_rate() const {
        return legs == CommissionLegs::ENTRY ? 0.0 : rate;
    }

    double calculate_fees(double qty, double price, bool is_sell) const {
        double notional = qty * price;
        return notional * (is_sell ? exit_rate() : entry_rate());
    }
};

struct AccountConfig {
    double initial_cash{100000.0};
    double position_size{0.0};              // 0 = invest all available cash
    CommissionConfig commission;
};

struct DataConfig {
    std::string symbol{"GC=F"};
    std::string csv_path{"data/GC=F.csv"};
    std::string start{"2015-01-01"};
    std::string end{};                      // empty = up to the last available bar
};

struct OutputConfig {
    std::string directory{"results"};
    bool write_report{true};
    bool write_trade_log{true};
    bool write_equity_curve{true};
    bool write_chart{true};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};                     // empty = console only
};

struct Config {
    StrategyConfig strategy;
    AccountConfig account;
    DataConfig data;
    OutputConfig output;
    LoggingConfig logging;
};

inline void validate(const StrategyConfig& cfg) {
    if (cfg.fast_window <= 0 || cfg.slow_window <= 0) {
        throw InvalidConfiguration("moving average windows must be positive (fast=" +
                                   std::to_string(cfg.fast_window) + ", slow=" +
                                   std::to_string(cfg.slow_window) + ")");
    }
    if (cfg.fast_window >= cfg.slow_window) {
        throw InvalidConfiguration("fast_window (" + std::to_string(cfg.fast_window) +
                                   ") must be smaller than slow_window (" +
                                   std::to_string(cfg.slow_window) + ")");
    }
}

inline void validate(const AccountConfig& cfg) {
    if (!(cfg.initial_cash > 0.0)) {
        throw InvalidConfiguration("initial_cash must be positive");
    }
    if (!(cfg.commission.rate >= 0.0 && cfg.commission.rate < 1.0)) {
        throw InvalidConfiguration("commission_rate must be in [0, 1)");
    }
    if (!(cfg.position_size >= 0.0)) {
        throw InvalidConfiguration("position_size must not be negative");
    }
}

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, true, true);
    if (j.contains("strategy")) {
        auto& s = j["strategy"];
        cfg.strategy.fast_window = s.value("fast_window", cfg.strategy.fast_window);
        cfg.strategy.slow_window = s.value("slow_window", cfg.strategy.slow_window);
    }
    if (j.contains("account")) {
        auto& a = j["account"];
        cfg.account.initial_cash = a.value("initial_cash", cfg.account.initial_cash);
        cfg.account.position_size = a.value("position_size", cfg.account.position_size);
        cfg.account.commission.rate = a.value("commission_rate", cfg.account.commission.rate);
        if (a.contains("commission_legs")) {
            cfg.account.commission.legs = parse_commission_legs(a["commission_legs"].get<std::string>());
        }
    }
    if (j.contains("data")) {
        auto& d = j["data"];
        cfg.data.symbol = d.value("symbol", cfg.data.symbol);
        cfg.data.csv_path = d.value("csv_path", cfg.data.csv_path);
        cfg.data.start = d.value("start", cfg.data.start);
        cfg.data.end = d.value("end", cfg.data.end);
    }
    if (j.contains("output")) {
        auto& o = j["output"];
        cfg.output.directory = o.value("directory", cfg.output.directory);
        cfg.output.write_report = o.value("write_report", cfg.output.write_report);
        cfg.output.write_trade_log = o.value("write_trade_log", cfg.output.write_trade_log);
        cfg.output.write_equity_curve = o.value("write_equity_curve", cfg.output.write_equity_curve);
        cfg.output.write_chart = o.value("write_chart", cfg.output.write_chart);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
    }
}

} // namespace crossover_sim

#include "data_source_csv.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace crossover_sim {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        out.push_back(utils::trim(cell));
    }
    if (!line.empty() && line.back() == ',') out.emplace_back();
    return out;
}

struct ColumnMap {
    int timestamp{-1};
    int open{-1};
    int high{-1};
    int low{-1};
    int close{-1};
    int volume{-1};
};

ColumnMap map_columns(const std::vector<std::string>& header) {
    ColumnMap cols;
    for (size_t i = 0; i < header.size(); ++i) {
        const std::string name = utils::to_lower(header[i]);
        const int idx = static_cast<int>(i);
        if (name == "date" || name == "datetime" || name == "timestamp" || name == "time") {
            if (cols.timestamp < 0) cols.timestamp = idx;
        } else if (name == "open") {
            cols.open = idx;
        } else if (name == "high") {
            cols.high = idx;
        } else if (name == "low") {
            cols.low = idx;
        } else if (name == "close") {
            cols.close = idx;
        } else if (name == "volume") {
            cols.volume = idx;
        }
    }
    return cols;
}

std::optional<double> parse_number(const std::vector<std::string>& cells, int idx) {
    if (idx < 0 || static_cast<size_t>(idx) >= cells.size() || cells[idx].empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double v = std::stod(cells[idx], &consumed);
        if (consumed != cells[idx].size() || !std::isfinite(v)) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

CsvDataSource::CsvDataSource(std::string path) : path_(std::move(path)) {}

CsvDataSource::~CsvDataSource() {
    disconnect();
}

void CsvDataSource::connect() {
    if (stream_.is_open()) return;
    stream_.open(path_);
    if (!stream_.is_open()) {
        throw DataSourceError("cannot open price file " + path_);
    }
    spdlog::debug("CsvDataSource: opened {}", path_);
}

void CsvDataSource::disconnect() {
    if (stream_.is_open()) {
        stream_.close();
        spdlog::debug("CsvDataSource: closed {}", path_);
    }
}

std::vector<Bar> CsvDataSource::get_bars(const std::string& symbol,
                                         std::optional<Timestamp> start_time,
                                         std::optional<Timestamp> end_time) {
    if (!stream_.is_open()) {
        throw DataSourceError("CsvDataSource not connected: " + path_);
    }
    stream_.clear();
    stream_.seekg(0);

    std::string line;
    if (!std::getline(stream_, line)) {
        throw DataSourceError("price file " + path_ + " is empty");
    }
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);
    const ColumnMap cols = map_columns(split_csv_line(line));
    if (cols.timestamp < 0 || cols.open < 0 || cols.high < 0 || cols.low < 0 || cols.close < 0) {
        throw DataSourceError("price file " + path_ +
                              " needs date, open, high, low and close columns");
    }

    std::vector<Bar> bars;
    size_t line_no = 1;
    size_t skipped = 0;
    while (std::getline(stream_, line)) {
        ++line_no;
        if (utils::trim(line).empty()) continue;
        auto cells = split_csv_line(line);

        std::optional<Timestamp> ts;
        if (static_cast<size_t>(cols.timestamp) < cells.size()) {
            ts = utils::parse_ts_any(cells[cols.timestamp]);
        }
        auto o = parse_number(cells, cols.open);
        auto h = parse_number(cells, cols.high);
        auto l = parse_number(cells, cols.low);
        auto c = parse_number(cells, cols.close);
        if (!ts || !o || !h || !l || !c) {
            if (skipped++ < 5) {
                spdlog::warn("{}:{}: skipping malformed row", path_, line_no);
            }
            continue;
        }
        if (start_time && *ts < *start_time) continue;
        if (end_time && *ts > *end_time) continue;

        Bar bar;
        bar.timestamp = *ts;
        bar.open = *o;
        bar.high = *h;
        bar.low = *l;
        bar.close = *c;
        bar.volume = parse_number(cells, cols.volume).value_or(0.0);
        bars.push_back(bar);
    }
    if (skipped > 0) {
        spdlog::warn("{}: skipped {} malformed rows", path_, skipped);
    }

    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
    auto last = std::unique(bars.begin(), bars.end(),
                            [](const Bar& a, const Bar& b) { return a.timestamp == b.timestamp; });
    if (last != bars.end()) {
        spdlog::warn("{}: dropped {} bars with duplicate timestamps",
                     path_, static_cast<size_t>(std::distance(last, bars.end())));
        bars.erase(last, bars.end());
    }

    spdlog::debug("CsvDataSource: {} bars for {} from {}", bars.size(), symbol, path_);
    return bars;
}

} // namespace crossover_sim

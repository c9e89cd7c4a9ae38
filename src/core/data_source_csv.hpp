#pragma once

#include "data_source.hpp"
#include <fstream>
#include <string>

namespace crossover_sim {

/**
 * Reads daily bars from a CSV file such as a Yahoo Finance export.
 *
 * The header row names the columns (case-insensitive): one of date, datetime,
 * timestamp or time, then open, high, low, close and optionally volume.
 * Malformed rows are skipped with a warning; rows are sorted and duplicate
 * timestamps keep the first occurrence.
 */
class CsvDataSource : public DataSource {
public:
    explicit CsvDataSource(std::string path);
    ~CsvDataSource() override;

    void connect() override;
    void disconnect() override;
    bool is_connected() const override { return stream_.is_open(); }

    std::vector<Bar> get_bars(const std::string& symbol,
                              std::optional<Timestamp> start_time,
                              std::optional<Timestamp> end_time) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream stream_;
};

} // namespace crossover_sim

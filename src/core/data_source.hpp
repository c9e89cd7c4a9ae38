#pragma once

#include <optional>
#include <string>
#include <vector>
#include "bar.hpp"

namespace crossover_sim {

/**
 * Supplier of historical daily bars for one instrument.
 * Implementations hold an external resource between connect() and disconnect().
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;

    // Bars in [start_time, end_time] sorted by timestamp, without duplicates.
    // An absent bound is open.
    virtual std::vector<Bar> get_bars(const std::string& symbol,
                                      std::optional<Timestamp> start_time,
                                      std::optional<Timestamp> end_time) = 0;
};

/**
 * Connects on construction and disconnects on destruction, so the source is
 * released whether or not the caller finishes.
 */
class DataSourceSession {
public:
    explicit DataSourceSession(DataSource& source) : source_(source) {
        source_.connect();
    }
    ~DataSourceSession() {
        source_.disconnect();
    }

    DataSourceSession(const DataSourceSession&) = delete;
    DataSourceSession& operator=(const DataSourceSession&) = delete;

    DataSource& source() { return source_; }

private:
    DataSource& source_;
};

// Fetch bars for symbol through a scoped session and wrap them in a PriceSeries.
PriceSeries load_price_series(DataSource& source,
                              const std::string& symbol,
                              std::optional<Timestamp> start_time,
                              std::optional<Timestamp> end_time);

} // namespace crossover_sim

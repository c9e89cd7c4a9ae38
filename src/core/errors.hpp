#pragma once

#include <stdexcept>
#include <string>

namespace crossover_sim {

/**
 * Base class for all errors raised by the simulator.
 */
class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

// Price series has no bars at all; nothing can be simulated.
class InsufficientData : public BacktestError {
public:
    using BacktestError::BacktestError;
};

// Strategy or account settings rejected before any bar is processed.
class InvalidConfiguration : public BacktestError {
public:
    using BacktestError::BacktestError;
};

// Bars out of order or duplicated.
class InvalidPriceSeries : public BacktestError {
public:
    using BacktestError::BacktestError;
};

class DataSourceError : public BacktestError {
public:
    using BacktestError::BacktestError;
};

} // namespace crossover_sim

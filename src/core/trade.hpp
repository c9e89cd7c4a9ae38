#pragma once

#include "bar.hpp"

namespace crossover_sim {

enum class OrderSide { BUY, SELL };

inline const char* to_string(OrderSide side) {
    return side == OrderSide::BUY ? "buy" : "sell";
}

struct Position {
    double entry_price{0.0};
    Timestamp entry_time;
    double size{0.0};
    double entry_commission{0.0};
};

/**
 * Closed round trip. pnl is gross; commission covers both legs.
 */
struct Trade {
    double entry_price{0.0};
    double exit_price{0.0};
    Timestamp entry_time;
    Timestamp exit_time;
    double size{0.0};
    double pnl{0.0};
    double commission{0.0};
    bool forced_exit{false};    // closed at the end of the series, not by a signal

    double net_pnl() const { return pnl - commission; }
    double return_pct() const {
        return entry_price > 0.0 ? (exit_price - entry_price) / entry_price : 0.0;
    }
};

// Fill location for chart overlays.
struct TradeMarker {
    Timestamp timestamp;
    double price{0.0};
    OrderSide side{OrderSide::BUY};
};

} // namespace crossover_sim

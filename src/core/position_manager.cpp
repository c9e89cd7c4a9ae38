#include "position_manager.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

namespace crossover_sim {

PositionManager::PositionManager(PortfolioAccountant& portfolio, const AccountConfig& config)
    : portfolio_(portfolio), config_(config) {}

std::optional<Trade> PositionManager::on_signal(Signal signal, const Bar& bar) {
    switch (signal) {
        case Signal::BUY:
            if (position_) {
                spdlog::debug("BUY ignored on {}: position already open", utils::ts_to_date(bar.timestamp));
                return std::nullopt;
            }
            open(bar);
            return std::nullopt;
        case Signal::SELL:
            if (!position_) {
                spdlog::debug("SELL ignored on {}: no open position", utils::ts_to_date(bar.timestamp));
                return std::nullopt;
            }
            return close(bar, false);
        case Signal::NONE:
            break;
    }
    return std::nullopt;
}

std::optional<Trade> PositionManager::force_close(const Bar& bar) {
    if (!position_) return std::nullopt;
    spdlog::info("Force-closing open position at end of data {} close={:.2f}",
                 utils::ts_to_date(bar.timestamp), bar.close);
    return close(bar, true);
}

void PositionManager::open(const Bar& bar) {
    const double price = bar.close;
    if (!(price > 0.0)) {
        spdlog::warn("BUY skipped on {}: non-positive close {}", utils::ts_to_date(bar.timestamp), price);
        return;
    }

    const double cash = portfolio_.cash();
    double size = 0.0;
    if (config_.position_size > 0.0) {
        size = config_.position_size;
        double required = size * price + config_.commission.calculate_fees(size, price, false);
        if (required > cash) {
            spdlog::warn("BUY skipped on {}: need {:.2f} for {} units, cash {:.2f}",
                         utils::ts_to_date(bar.timestamp), required, size, cash);
            return;
        }
    } else {
        // Entry fee is part of the outlay so cash ends at zero.
        size = cash / (price * (1.0 + config_.commission.entry_rate()));
    }
    if (!(size > 0.0)) {
        spdlog::warn("BUY skipped on {}: no cash available", utils::ts_to_date(bar.timestamp));
        return;
    }

    double fees = config_.commission.calculate_fees(size, price, false);
    portfolio_.debit(size * price + fees);
    total_commission_ += fees;

    Position pos;
    pos.entry_price = price;
    pos.entry_time = bar.timestamp;
    pos.size = size;
    pos.entry_commission = fees;
    position_ = pos;
    markers_.push_back({bar.timestamp, price, OrderSide::BUY});

    spdlog::info("BUY  {} size={:.4f} price={:.2f} fees={:.2f} cash={:.2f}",
                 utils::ts_to_date(bar.timestamp), size, price, fees, portfolio_.cash());
}

Trade PositionManager::close(const Bar& bar, bool forced) {
    const Position pos = *position_;
    const double price = bar.close;
    double fees = config_.commission.calculate_fees(pos.size, price, true);
    portfolio_.credit(pos.size * price - fees);
    total_commission_ += fees;

    Trade trade;
    trade.entry_price = pos.entry_price;
    trade.exit_price = price;
    trade.entry_time = pos.entry_time;
    trade.exit_time = bar.timestamp;
    trade.size = pos.size;
    trade.pnl = (price - pos.entry_price) * pos.size;
    trade.commission = pos.entry_commission + fees;
    trade.forced_exit = forced;

    trades_.push_back(trade);
    markers_.push_back({bar.timestamp, price, OrderSide::SELL});
    position_.reset();

    spdlog::info("SELL {} size={:.4f} price={:.2f} pnl={:.2f} fees={:.2f} cash={:.2f}{}",
                 utils::ts_to_date(bar.timestamp), trade.size, price, trade.pnl, fees,
                 portfolio_.cash(), forced ? " (forced)" : "");
    return trade;
}

} // namespace crossover_sim

#include <gtest/gtest.h>
#include "../src/core/position_manager.hpp"
#include "test_helpers.hpp"

using namespace crossover_sim;
using crossover_sim::test_util::make_bar;

static AccountConfig account(double cash, double rate = 0.0, CommissionLegs legs = CommissionLegs::BOTH) {
    AccountConfig cfg;
    cfg.initial_cash = cash;
    cfg.commission.rate = rate;
    cfg.commission.legs = legs;
    return cfg;
}

TEST(PositionManagerTest, BuyOpensFullyInvested) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0));
    auto trade = pm.on_signal(Signal::BUY, make_bar(0, 10.0));
    EXPECT_FALSE(trade.has_value());
    ASSERT_TRUE(pm.has_position());
    EXPECT_DOUBLE_EQ(pm.position()->size, 100.0);
    EXPECT_DOUBLE_EQ(pm.position()->entry_price, 10.0);
    EXPECT_NEAR(pf.cash(), 0.0, 1e-9);
    ASSERT_EQ(pm.markers().size(), 1u);
    EXPECT_EQ(pm.markers()[0].side, OrderSide::BUY);
}

TEST(PositionManagerTest, BuyWhileOpenIsNoop) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0));
    pm.on_signal(Signal::BUY, make_bar(0, 10.0));
    pm.on_signal(Signal::BUY, make_bar(1, 5.0));
    EXPECT_DOUBLE_EQ(pm.position()->entry_price, 10.0);
    EXPECT_DOUBLE_EQ(pm.position()->size, 100.0);
    EXPECT_EQ(pm.markers().size(), 1u);
}

TEST(PositionManagerTest, SellWithoutPositionIsNoop) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0));
    auto trade = pm.on_signal(Signal::SELL, make_bar(0, 10.0));
    EXPECT_FALSE(trade.has_value());
    EXPECT_FALSE(pm.has_position());
    EXPECT_DOUBLE_EQ(pf.cash(), 1000.0);
    EXPECT_TRUE(pm.trades().empty());
}

TEST(PositionManagerTest, SellClosesAndRecordsTrade) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0));
    pm.on_signal(Signal::BUY, make_bar(0, 10.0));
    auto trade = pm.on_signal(Signal::SELL, make_bar(5, 12.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_FALSE(pm.has_position());
    EXPECT_DOUBLE_EQ(trade->pnl, 200.0);
    EXPECT_DOUBLE_EQ(trade->commission, 0.0);
    EXPECT_EQ(trade->entry_time, make_bar(0, 10.0).timestamp);
    EXPECT_EQ(trade->exit_time, make_bar(5, 12.0).timestamp);
    EXPECT_FALSE(trade->forced_exit);
    EXPECT_NEAR(pf.cash(), 1200.0, 1e-9);
    EXPECT_EQ(pm.trades().size(), 1u);
    ASSERT_EQ(pm.markers().size(), 2u);
    EXPECT_EQ(pm.markers()[1].side, OrderSide::SELL);
}

TEST(PositionManagerTest, NoneSignalDoesNothing) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0));
    EXPECT_FALSE(pm.on_signal(Signal::NONE, make_bar(0, 10.0)).has_value());
    EXPECT_FALSE(pm.has_position());
    EXPECT_DOUBLE_EQ(pf.cash(), 1000.0);
}

TEST(PositionManagerTest, CommissionOnBothLegs) {
    PortfolioAccountant pf(1010.0);
    PositionManager pm(pf, account(1010.0, 0.01));
    pm.on_signal(Signal::BUY, make_bar(0, 10.0));
    EXPECT_NEAR(pm.position()->size, 100.0, 1e-9);
    EXPECT_NEAR(pf.cash(), 0.0, 1e-9);
    auto trade = pm.on_signal(Signal::SELL, make_bar(1, 12.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_NEAR(trade->pnl, 200.0, 1e-9);
    EXPECT_NEAR(trade->commission, 10.0 + 12.0, 1e-9);
    EXPECT_NEAR(pf.cash(), 1188.0, 1e-9);
    EXPECT_NEAR(pm.total_commission(), 22.0, 1e-9);
    EXPECT_NEAR(pf.cash() - 1010.0, trade->net_pnl(), 1e-9);
}

TEST(PositionManagerTest, CommissionOnEntryOnly) {
    PortfolioAccountant pf(1010.0);
    PositionManager pm(pf, account(1010.0, 0.01, CommissionLegs::ENTRY));
    pm.on_signal(Signal::BUY, make_bar(0, 10.0));
    auto trade = pm.on_signal(Signal::SELL, make_bar(1, 12.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_NEAR(trade->commission, 10.0, 1e-9);
    EXPECT_NEAR(pf.cash(), 1200.0, 1e-9);
}

TEST(PositionManagerTest, CommissionOnExitOnly) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0, 0.01, CommissionLegs::EXIT));
    pm.on_signal(Signal::BUY, make_bar(0, 10.0));
    EXPECT_DOUBLE_EQ(pm.position()->size, 100.0);
    auto trade = pm.on_signal(Signal::SELL, make_bar(1, 12.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_NEAR(trade->commission, 12.0, 1e-9);
    EXPECT_NEAR(pf.cash(), 1188.0, 1e-9);
}

TEST(PositionManagerTest, FixedSizeSkippedWhenCashShort) {
    PortfolioAccountant pf(100.0);
    AccountConfig cfg = account(100.0);
    cfg.position_size = 10.0;
    PositionManager pm(pf, cfg);
    pm.on_signal(Signal::BUY, make_bar(0, 20.0));
    EXPECT_FALSE(pm.has_position());
    EXPECT_DOUBLE_EQ(pf.cash(), 100.0);
    pm.on_signal(Signal::BUY, make_bar(1, 5.0));
    ASSERT_TRUE(pm.has_position());
    EXPECT_DOUBLE_EQ(pm.position()->size, 10.0);
    EXPECT_DOUBLE_EQ(pf.cash(), 50.0);
}

TEST(PositionManagerTest, ForceCloseMarksTradeForced) {
    PortfolioAccountant pf(1000.0);
    PositionManager pm(pf, account(1000.0));
    EXPECT_FALSE(pm.force_close(make_bar(0, 10.0)).has_value());
    pm.on_signal(Signal::BUY, make_bar(1, 10.0));
    auto trade = pm.force_close(make_bar(2, 9.0));
    ASSERT_TRUE(trade.has_value());
    EXPECT_TRUE(trade->forced_exit);
    EXPECT_DOUBLE_EQ(trade->pnl, -100.0);
    EXPECT_FALSE(pm.has_position());
    EXPECT_NEAR(pf.cash(), 900.0, 1e-9);
}

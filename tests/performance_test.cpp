#include <gtest/gtest.h>
#include <cmath>
#include "../src/core/performance.hpp"
#include "test_helpers.hpp"

using namespace crossover_sim;
using crossover_sim::test_util::day;
using crossover_sim::test_util::make_bar;

static std::vector<EquityPoint> curve(const std::vector<double>& values) {
    std::vector<EquityPoint> out;
    for (size_t i = 0; i < values.size(); ++i) out.push_back({day(i), values[i]});
    return out;
}

TEST(PerformanceTest, MetricsBasic) {
    PortfolioAccountant pf(100.0);
    pf.record(Timestamp{} + std::chrono::seconds(0), 100.0);
    pf.record(Timestamp{} + std::chrono::seconds(1), 110.0);
    pf.record(Timestamp{} + std::chrono::seconds(2), 105.0);
    auto m = pf.metrics({});
    EXPECT_NEAR(m.total_return, 0.05, 1e-6);
    EXPECT_NEAR(m.max_drawdown, (110.0 - 105.0) / 110.0, 1e-6);
    EXPECT_EQ(m.max_drawdown_duration, 1u);
    EXPECT_NE(m.sharpe, 0.0);
}

TEST(PerformanceTest, RecordSameTimestampReplaces) {
    PortfolioAccountant pf(100.0);
    pf.record(day(0), 100.0);
    pf.record(day(1), 101.0);
    pf.record(day(1), 99.0);
    ASSERT_EQ(pf.equity_curve().size(), 2u);
    EXPECT_DOUBLE_EQ(pf.equity_curve().back().equity, 99.0);
    EXPECT_EQ(pf.points(1).size(), 1u);
}

TEST(PerformanceTest, MarkUsesCloseOfOpenPosition) {
    PortfolioAccountant pf(1000.0);
    pf.debit(500.0);
    Position pos;
    pos.entry_price = 10.0;
    pos.size = 50.0;
    EXPECT_DOUBLE_EQ(pf.mark(make_bar(0, 12.0), pos), 500.0 + 600.0);
    EXPECT_DOUBLE_EQ(pf.mark(make_bar(1, 12.0), std::nullopt), 500.0);
    EXPECT_EQ(pf.equity_curve().size(), 2u);
}

TEST(PerformanceTest, FlatCurveHasZeroSharpe) {
    auto m = compute_metrics(100.0, curve(std::vector<double>(300, 100.0)), {});
    EXPECT_EQ(m.sharpe, 0.0);
    EXPECT_FALSE(std::isnan(m.sharpe));
    EXPECT_EQ(m.max_drawdown, 0.0);
    EXPECT_EQ(m.total_return, 0.0);
    EXPECT_EQ(m.annualized_return, 0.0);
    EXPECT_FALSE(m.win_rate.has_value());
}

TEST(PerformanceTest, SinglePointCurve) {
    auto m = compute_metrics(100.0, curve({100.0}), {});
    EXPECT_EQ(m.sharpe, 0.0);
    EXPECT_EQ(m.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(m.ending_value, 100.0);
}

TEST(PerformanceTest, NonDecreasingCurveHasNoDrawdown) {
    auto m = compute_metrics(100.0, curve({100.0, 100.0, 101.0, 105.0, 105.0, 120.0}), {});
    EXPECT_EQ(m.max_drawdown, 0.0);
    EXPECT_EQ(m.max_drawdown_duration, 0u);
    EXPECT_GT(m.sharpe, 0.0);
}

TEST(PerformanceTest, DrawdownAgainstRunningPeak) {
    auto m = compute_metrics(100.0, curve({100.0, 120.0, 90.0, 110.0, 60.0, 130.0, 125.0}), {});
    EXPECT_NEAR(m.max_drawdown, 0.5, 1e-12);
    EXPECT_EQ(m.max_drawdown_duration, 3u);
    EXPECT_GE(m.max_drawdown, 0.0);
    EXPECT_LE(m.max_drawdown, 1.0);
}

TEST(PerformanceTest, AnnualizedReturnUses252DayYear) {
    std::vector<double> values(504, 100.0);
    values.back() = 121.0;
    auto m = compute_metrics(100.0, curve(values), {});
    EXPECT_NEAR(m.total_return, 0.21, 1e-12);
    EXPECT_NEAR(m.annualized_return, 0.10, 1e-12);
}

TEST(PerformanceTest, TradeStatistics) {
    std::vector<Trade> trades(3);
    trades[0].pnl = 50.0;
    trades[0].commission = 1.0;
    trades[1].pnl = -20.0;
    trades[1].commission = 1.0;
    trades[2].pnl = 30.0;
    trades[2].commission = 2.0;
    auto m = compute_metrics(100.0, curve({100.0, 156.0}), trades);
    EXPECT_EQ(m.total_trades, 3u);
    EXPECT_EQ(m.winning_trades, 2u);
    EXPECT_EQ(m.losing_trades, 1u);
    ASSERT_TRUE(m.win_rate.has_value());
    EXPECT_NEAR(*m.win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(m.average_win, 38.5);
    EXPECT_DOUBLE_EQ(m.average_loss, -21.0);
    EXPECT_DOUBLE_EQ(m.total_pnl, 60.0);
    EXPECT_DOUBLE_EQ(m.total_commission, 4.0);
}

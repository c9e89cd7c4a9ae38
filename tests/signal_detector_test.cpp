#include <gtest/gtest.h>
#include "../src/core/signal_detector.hpp"

using namespace crossover_sim;

static MovingAverages ma(double fast, double slow) {
    return MovingAverages{fast, slow};
}

TEST(SignalDetectorTest, NoneWhileWarmingUp) {
    SignalDetector det;
    MovingAverages warming{1.0, std::nullopt};
    EXPECT_EQ(det.detect(warming, ma(2.0, 1.0)), Signal::NONE);
    EXPECT_EQ(det.detect(ma(0.0, 1.0), warming), Signal::NONE);
    EXPECT_EQ(classify_crossover(MovingAverages{}, ma(2.0, 1.0)), Signal::NONE);
}

TEST(SignalDetectorTest, GoldenCross) {
    SignalDetector det;
    EXPECT_EQ(det.detect(ma(9.0, 10.0), ma(11.0, 10.0)), Signal::BUY);
    EXPECT_EQ(det.last_side(), 1);
}

TEST(SignalDetectorTest, DeathCross) {
    SignalDetector det;
    EXPECT_EQ(det.detect(ma(11.0, 10.0), ma(9.0, 10.0)), Signal::SELL);
    EXPECT_EQ(det.last_side(), -1);
}

TEST(SignalDetectorTest, EqualityOnPreviousSideStillFires) {
    SignalDetector det;
    EXPECT_EQ(det.detect(ma(10.0, 10.0), ma(10.5, 10.0)), Signal::BUY);
    SignalDetector det2;
    EXPECT_EQ(det2.detect(ma(10.0, 10.0), ma(9.5, 10.0)), Signal::SELL);
}

TEST(SignalDetectorTest, FiresOncePerCrossover) {
    SignalDetector det;
    EXPECT_EQ(det.detect(ma(9.0, 10.0), ma(11.0, 10.0)), Signal::BUY);
    EXPECT_EQ(det.detect(ma(11.0, 10.0), ma(12.0, 10.0)), Signal::NONE);
    EXPECT_EQ(det.detect(ma(12.0, 10.0), ma(13.0, 10.0)), Signal::NONE);
}

TEST(SignalDetectorTest, TouchingEqualityDoesNotRefire) {
    SignalDetector det;
    EXPECT_EQ(det.detect(ma(9.0, 10.0), ma(11.0, 10.0)), Signal::BUY);
    EXPECT_EQ(det.detect(ma(11.0, 10.0), ma(10.0, 10.0)), Signal::NONE);
    EXPECT_EQ(det.detect(ma(10.0, 10.0), ma(10.0, 10.0)), Signal::NONE);
    EXPECT_EQ(det.detect(ma(10.0, 10.0), ma(11.0, 10.0)), Signal::NONE);
    // The stateless rule alone would fire again here.
    EXPECT_EQ(classify_crossover(ma(10.0, 10.0), ma(11.0, 10.0)), Signal::BUY);
    EXPECT_EQ(det.detect(ma(11.0, 10.0), ma(9.0, 10.0)), Signal::SELL);
}

TEST(SignalDetectorTest, ResetForgetsSide) {
    SignalDetector det;
    det.detect(ma(9.0, 10.0), ma(11.0, 10.0));
    det.reset();
    EXPECT_EQ(det.last_side(), 0);
    EXPECT_EQ(det.detect(ma(10.0, 10.0), ma(11.0, 10.0)), Signal::BUY);
}

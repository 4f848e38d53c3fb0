// =============================================================================
// risk_governor_test.cpp
// =============================================================================
// Unit tests for rebal::RiskGovernor.
//
// Validates:
//   - Drawdown gate (11% fails, exactly 10% passes)
//   - Single-asset exposure gate (36% fails, exactly 35% passes)
//   - Daily loss gate against initial cash
//   - Every gate is evaluated; the first breach is reported, all are listed
//   - Peak is monotonic; start-up calibration happens once
//   - Invalid equity, operator halt, RiskViolationEvent publication
// =============================================================================

#include "rebal/risk/risk_governor.hpp"
#include "rebal/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>
#include <unordered_map>
#include <vector>

using rebal::domain::PortfolioState;
using rebal::domain::RiskRule;

class RiskGovernorTest : public ::testing::Test {
 protected:
  RiskGovernorTest() : governor(bus, limits, clock) {}

  // Fresh session state whose start-up calibration has already run.
  static PortfolioState calibratedState(double initial_cash) {
    PortfolioState state = PortfolioState::fromInitialCash(initial_cash);
    state.peak_calibrated = true;
    return state;
  }

  rebal::EventBus bus;
  rebal::domain::RiskLimits limits;
  rebal::SimulationTimeProvider clock{1'700'000'000'000};
  rebal::RiskGovernor governor;
  const std::unordered_map<std::string, double> no_positions;
};

// -----------------------------------------------------------------------------
// 1. Equity falls 11% from the peak: drawdown breach, verdict fails.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, DrawdownAboveLimitFails) {
  PortfolioState state = PortfolioState::fromInitialCash(10000.0);
  ASSERT_TRUE(governor.evaluate(state, 10000.0, no_positions).passed);

  auto verdict = governor.evaluate(state, 8900.0, no_positions);

  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::MaxDrawdown);
  EXPECT_NEAR(verdict.drawdown_fraction, 0.11, 1e-12);
  EXPECT_DOUBLE_EQ(verdict.peak_equity, 10000.0);
}

TEST_F(RiskGovernorTest, DrawdownAtLimitPasses) {
  PortfolioState state = calibratedState(10000.0);
  auto verdict = governor.evaluate(state, 9000.0, no_positions);
  EXPECT_TRUE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::None);
}

// -----------------------------------------------------------------------------
// 2. One symbol at 36% of equity fails the whole cycle.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, SingleAssetExposureAboveLimitFails) {
  PortfolioState state = calibratedState(10000.0);
  auto verdict = governor.evaluate(
      state, 10000.0, {{"BTC/USD", 3600.0}, {"ETH/USD", 100.0}});

  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::SingleAssetExposure);
  ASSERT_EQ(verdict.breaches.size(), 1u);
  EXPECT_EQ(verdict.breaches[0].symbol, "BTC/USD");
  EXPECT_NEAR(verdict.breaches[0].current_value, 0.36, 1e-12);
  EXPECT_DOUBLE_EQ(verdict.breaches[0].limit_value, 0.35);
}

TEST_F(RiskGovernorTest, SingleAssetExposureAtLimitPasses) {
  PortfolioState state = calibratedState(10000.0);
  const std::unordered_map<std::string, double> positions{{"BTC/USD", 3500.0}};
  EXPECT_TRUE(governor.evaluate(state, 10000.0, positions).passed);
}

// -----------------------------------------------------------------------------
// 3. Daily loss floor is 4% of initial cash.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, DailyLossBeyondLimitFails) {
  PortfolioState state = calibratedState(10000.0);
  state.daily_pnl = -401.0;

  auto verdict = governor.evaluate(state, 9700.0, no_positions);
  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::DailyLoss);
}

TEST_F(RiskGovernorTest, DailyLossAtLimitPasses) {
  PortfolioState state = calibratedState(10000.0);
  state.daily_pnl = -400.0;
  EXPECT_TRUE(governor.evaluate(state, 9700.0, no_positions).passed);
}

// -----------------------------------------------------------------------------
// 4. All gates run even after the first failure.
// Why: operators need the complete list of violated limits, not just one.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, AllGatesEvaluatedFirstBreachReported) {
  PortfolioState state = calibratedState(10000.0);
  state.daily_pnl = -2000.0;

  auto verdict = governor.evaluate(
      state, 8000.0, {{"ETH/USD", 3000.0}, {"BTC/USD", 4000.0}});

  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::MaxDrawdown);
  ASSERT_EQ(verdict.breaches.size(), 4u);
  EXPECT_EQ(verdict.breaches[0].rule, RiskRule::MaxDrawdown);
  EXPECT_EQ(verdict.breaches[1].rule, RiskRule::SingleAssetExposure);
  EXPECT_EQ(verdict.breaches[1].symbol, "BTC/USD");
  EXPECT_EQ(verdict.breaches[2].symbol, "ETH/USD");
  EXPECT_EQ(verdict.breaches[3].rule, RiskRule::DailyLoss);
}

// -----------------------------------------------------------------------------
// 5. The peak only ever moves up during normal evaluation.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, PeakIsMonotonic) {
  PortfolioState state = calibratedState(10000.0);
  double last_peak = state.peak_equity;

  for (double equity : {10000.0, 12000.0, 11000.0, 12500.0, 9000.0}) {
    governor.evaluate(state, equity, no_positions);
    EXPECT_GE(state.peak_equity, last_peak);
    last_peak = state.peak_equity;
  }
  EXPECT_DOUBLE_EQ(state.peak_equity, 12500.0);
}

// -----------------------------------------------------------------------------
// 6. Start-up calibration: a session that opens below its funded cash
//    anchors the peak to the first observed equity, once.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, PeakCalibratedOnFirstEvaluation) {
  PortfolioState state = PortfolioState::fromInitialCash(10000.0);

  auto first = governor.evaluate(state, 8900.0, no_positions);
  EXPECT_TRUE(first.passed);
  EXPECT_DOUBLE_EQ(state.peak_equity, 8900.0);
  EXPECT_TRUE(state.peak_calibrated);

  governor.evaluate(state, 8800.0, no_positions);
  EXPECT_DOUBLE_EQ(state.peak_equity, 8900.0);
}

TEST(RiskGovernorCalibrationTest, CalibrationCanBeDisabled) {
  rebal::EventBus bus;
  rebal::SimulationTimeProvider clock;
  rebal::domain::RiskLimits limits;
  limits.calibrate_peak_on_start = false;
  rebal::RiskGovernor governor(bus, limits, clock);

  PortfolioState state = PortfolioState::fromInitialCash(10000.0);
  auto verdict = governor.evaluate(state, 8900.0, {});

  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::MaxDrawdown);
}

// -----------------------------------------------------------------------------
// 7. Non-positive equity makes the ratios undefined.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, NonPositiveEquityFails) {
  PortfolioState state = calibratedState(10000.0);
  auto verdict = governor.evaluate(state, 0.0, {{"BTC/USD", 100.0}});

  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::InvalidEquity);
  for (const auto& breach : verdict.breaches) {
    EXPECT_NE(breach.rule, RiskRule::SingleAssetExposure);
  }
}

TEST_F(RiskGovernorTest, NonPositivePeakFails) {
  PortfolioState state = calibratedState(0.0);
  auto verdict = governor.evaluate(state, -5.0, no_positions);
  EXPECT_FALSE(verdict.passed);
  EXPECT_EQ(verdict.breached, RiskRule::InvalidEquity);
}

// -----------------------------------------------------------------------------
// 8. Operator halt overrides an otherwise clean verdict.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, HaltFailsUntilResumed) {
  PortfolioState state = calibratedState(10000.0);

  governor.haltTrading();
  EXPECT_TRUE(governor.isHalted());
  auto halted = governor.evaluate(state, 10000.0, no_positions);
  EXPECT_FALSE(halted.passed);
  EXPECT_EQ(halted.breached, RiskRule::OperatorHalt);

  governor.resumeTrading();
  EXPECT_FALSE(governor.isHalted());
  EXPECT_TRUE(governor.evaluate(state, 10000.0, no_positions).passed);
}

// -----------------------------------------------------------------------------
// 9. Each breach is published with the cycle id.
// -----------------------------------------------------------------------------
TEST_F(RiskGovernorTest, BreachesArePublished) {
  std::vector<rebal::RiskViolationEvent> seen;
  bus.subscribe<rebal::RiskViolationEvent>(
      [&seen](const rebal::RiskViolationEvent& e) { seen.push_back(e); });

  PortfolioState state = calibratedState(10000.0);
  state.daily_pnl = -1000.0;
  governor.evaluate(state, 8000.0, no_positions, 42);

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0].breach.rule, RiskRule::MaxDrawdown);
  EXPECT_EQ(seen[1].breach.rule, RiskRule::DailyLoss);
  EXPECT_EQ(seen[0].sequence_id, 42u);
}

TEST_F(RiskGovernorTest, MaxPositionUsd) {
  EXPECT_DOUBLE_EQ(governor.maxPositionUsd(10000.0), 3500.0);
  EXPECT_DOUBLE_EQ(governor.maxPositionUsd(-100.0), 0.0);
}

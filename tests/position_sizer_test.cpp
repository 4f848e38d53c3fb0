// =============================================================================
// position_sizer_test.cpp
// =============================================================================
// Unit tests for rebal::PositionSizer.
//
// Validates:
//   - Momentum → target mapping with the configured USD-per-return scale
//   - Sell floor on both bases (available cash, current exposure)
//   - Single-asset exposure clip, cash buffer clip, holdings clip
//   - Invalid price → ArithmeticFault, zero gap → no-op intent
// =============================================================================

#include "rebal/sizing/position_sizer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <variant>

using rebal::domain::FaultKind;
using rebal::domain::Side;
using rebal::domain::SymbolFault;
using rebal::domain::TradeIntent;

namespace {

rebal::SizingInput makeInput(double ret, double current, double cash,
                             double price, double held = 0.0) {
  rebal::SizingInput in;
  in.symbol = "BTC/USD";
  in.return_fraction = ret;
  in.current_usd = current;
  in.available_cash_usd = cash;
  in.price = price;
  in.held_quantity = held;
  return in;
}

TradeIntent intentOf(const rebal::domain::SymbolResult<TradeIntent>& r) {
  return std::get<TradeIntent>(r);
}

}  // namespace

class PositionSizerTest : public ::testing::Test {
 protected:
  rebal::SizingConfig config;
  rebal::PositionSizer sizer{config};
};

// -----------------------------------------------------------------------------
// 1. +5% momentum, no holding, 10k cash: a 100 USD buy.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, PositiveMomentumBuysTarget) {
  auto result = sizer.size(makeInput(0.05, 0.0, 10000.0, 50000.0));
  ASSERT_TRUE(std::holds_alternative<TradeIntent>(result));

  const TradeIntent intent = intentOf(result);
  EXPECT_NEAR(intent.target_usd, 100.0, 1e-9);
  EXPECT_NEAR(intent.diff_usd, 100.0, 1e-9);
  EXPECT_NEAR(intent.raw_quantity, 0.002, 1e-12);
  EXPECT_EQ(intent.side, Side::Buy);
  EXPECT_DOUBLE_EQ(intent.reference_price, 50000.0);
}

TEST_F(PositionSizerTest, ExistingHoldingReducesGap) {
  const TradeIntent intent =
      intentOf(sizer.size(makeInput(0.05, 40.0, 10000.0, 100.0)));
  EXPECT_NEAR(intent.diff_usd, 60.0, 1e-9);
  EXPECT_NEAR(intent.raw_quantity, 0.6, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Sell floor, default basis: half of available cash.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, CashFloorBoundsNegativeTarget) {
  EXPECT_NEAR(sizer.targetUsd(-1.0, 0.0, 10000.0), -2000.0, 1e-9);
  EXPECT_NEAR(sizer.targetUsd(-5.0, 0.0, 10000.0), -5000.0, 1e-9);
  EXPECT_NEAR(sizer.targetUsd(-5.0, 9000.0, 2000.0), -1000.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Sell floor, per-asset basis: target >= -current_usd * 0.5 always.
// -----------------------------------------------------------------------------
TEST(PositionSizerExposureBasisTest, TargetNeverBelowHalfCurrentExposure) {
  rebal::SizingConfig cfg;
  cfg.sell_floor_basis = rebal::SellFloorBasis::CurrentExposure;
  rebal::PositionSizer sizer(cfg);

  for (double ret : {-10.0, -1.0, -0.3, -0.01, 0.0, 0.02}) {
    for (double current : {0.0, 100.0, 1000.0, 5000.0}) {
      const double target = sizer.targetUsd(ret, current, 10000.0);
      EXPECT_GE(target, -current * 0.5) << "ret=" << ret << " cur=" << current;
    }
  }
  EXPECT_NEAR(sizer.targetUsd(-1.0, 1000.0, 10000.0), -500.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 4. Exposure clip: current + diff never exceeds the per-symbol cap.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, ExposureLimitClipsBuy) {
  auto in = makeInput(2.0, 1000.0, 10000.0, 100.0);
  in.max_position_usd = 3500.0;

  const TradeIntent intent = intentOf(sizer.size(in));
  EXPECT_NEAR(intent.target_usd, 4000.0, 1e-9);
  EXPECT_NEAR(intent.diff_usd, 2500.0, 1e-9);
  EXPECT_LE(in.current_usd + intent.diff_usd, 3500.0 + 1e-9);
}

TEST(PositionSizerClipDisabledTest, NoExposureClipWhenDisabled) {
  rebal::SizingConfig cfg;
  cfg.clip_to_exposure_limit = false;
  rebal::PositionSizer sizer(cfg);

  auto in = makeInput(2.0, 0.0, 10000.0, 100.0);
  in.max_position_usd = 3500.0;
  EXPECT_NEAR(std::get<TradeIntent>(sizer.size(in)).diff_usd, 4000.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. Buys never spend more than 99.5% of available cash.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, CashBufferClipsBuy) {
  const TradeIntent intent =
      intentOf(sizer.size(makeInput(5.0, 0.0, 1000.0, 10.0)));
  EXPECT_NEAR(intent.diff_usd, 995.0, 1e-9);
  EXPECT_NEAR(intent.raw_quantity, 99.5, 1e-9);
}

TEST_F(PositionSizerTest, NoCashMeansNoBuy) {
  const TradeIntent intent =
      intentOf(sizer.size(makeInput(0.5, 0.0, 0.0, 10.0)));
  EXPECT_DOUBLE_EQ(intent.diff_usd, 0.0);
  EXPECT_TRUE(intent.isNoOp());
}

// -----------------------------------------------------------------------------
// 6. Sells never exceed the held quantity.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, SellClippedToHoldings) {
  const TradeIntent intent =
      intentOf(sizer.size(makeInput(-1.0, 500.0, 10000.0, 100.0, 5.0)));
  EXPECT_EQ(intent.side, Side::Sell);
  EXPECT_NEAR(intent.diff_usd, -2500.0, 1e-9);
  EXPECT_NEAR(intent.raw_quantity, -5.0, 1e-12);
}

TEST_F(PositionSizerTest, SellWithNothingHeldIsNoOp) {
  const TradeIntent intent =
      intentOf(sizer.size(makeInput(-0.1, 0.0, 10000.0, 100.0, 0.0)));
  EXPECT_EQ(intent.side, Side::Sell);
  EXPECT_DOUBLE_EQ(intent.raw_quantity, 0.0);
  EXPECT_TRUE(intent.isNoOp());
}

// -----------------------------------------------------------------------------
// 7. A price that cannot be divided by is a per-symbol fault.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, InvalidPriceIsArithmeticFault) {
  for (double price : {0.0, -3.0, std::numeric_limits<double>::infinity()}) {
    auto result = sizer.size(makeInput(0.05, 0.0, 10000.0, price));
    ASSERT_TRUE(std::holds_alternative<SymbolFault>(result)) << price;
    EXPECT_EQ(std::get<SymbolFault>(result).kind, FaultKind::ArithmeticFault);
  }
}

TEST_F(PositionSizerTest, ZeroMomentumFlatPositionIsNoOp) {
  const TradeIntent intent =
      intentOf(sizer.size(makeInput(0.0, 0.0, 10000.0, 100.0)));
  EXPECT_TRUE(intent.isNoOp());
}

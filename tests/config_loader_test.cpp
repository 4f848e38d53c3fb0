// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for the JSON configuration layer.
//
// Validates:
//   - An empty document yields the documented defaults
//   - Partial documents override only the keys they name
//   - Wrong types, unknown enum strings and out-of-range values → ConfigError
//   - loadConfigFile reports missing and malformed files as ConfigError
// =============================================================================

#include "rebal/config/config_loader.hpp"
#include "rebal/domain/errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Defaults.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EmptyDocumentGivesDefaults) {
  auto cfg = rebal::parseConfig(json::object());

  EXPECT_DOUBLE_EQ(cfg.sizing.usd_per_unit_return, 2000.0);
  EXPECT_DOUBLE_EQ(cfg.sizing.sell_floor_fraction, 0.5);
  EXPECT_EQ(cfg.sizing.sell_floor_basis, rebal::SellFloorBasis::AvailableCash);
  EXPECT_DOUBLE_EQ(cfg.sizing.cash_buffer_fraction, 0.995);
  EXPECT_TRUE(cfg.sizing.clip_to_exposure_limit);
  EXPECT_DOUBLE_EQ(cfg.normalizer.min_trade_usd, 50.0);
  EXPECT_DOUBLE_EQ(cfg.risk.max_drawdown_fraction, 0.10);
  EXPECT_DOUBLE_EQ(cfg.risk.max_single_asset_fraction, 0.35);
  EXPECT_DOUBLE_EQ(cfg.risk.max_daily_loss_fraction, 0.04);
  EXPECT_TRUE(cfg.risk.calibrate_peak_on_start);
  EXPECT_EQ(cfg.harness.cycle_interval_seconds, 3600);
  EXPECT_TRUE(cfg.harness.symbols.empty());
}

// -----------------------------------------------------------------------------
// 2. Overrides.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, OverridesNamedKeysOnly) {
  auto cfg = rebal::parseConfig(json::parse(R"({
    "sizing": {"sell_floor_basis": "current_exposure",
               "usd_per_unit_return": 500},
    "normalizer": {"min_trade_usd": 500},
    "risk": {"max_drawdown_fraction": 0.2},
    "harness": {"symbols": ["BTC/USD", "ETH/USD"], "initial_cash": 50000}
  })"));

  EXPECT_EQ(cfg.sizing.sell_floor_basis,
            rebal::SellFloorBasis::CurrentExposure);
  EXPECT_DOUBLE_EQ(cfg.sizing.usd_per_unit_return, 500.0);
  EXPECT_DOUBLE_EQ(cfg.sizing.cash_buffer_fraction, 0.995);
  EXPECT_DOUBLE_EQ(cfg.normalizer.min_trade_usd, 500.0);
  EXPECT_DOUBLE_EQ(cfg.risk.max_drawdown_fraction, 0.2);
  EXPECT_DOUBLE_EQ(cfg.risk.max_single_asset_fraction, 0.35);
  ASSERT_EQ(cfg.harness.symbols.size(), 2u);
  EXPECT_EQ(cfg.harness.symbols[1], "ETH/USD");
  EXPECT_DOUBLE_EQ(cfg.harness.initial_cash, 50000.0);
}

// -----------------------------------------------------------------------------
// 3. Rejections.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, RejectsWrongType) {
  const auto doc = json::parse(R"({"risk": {"max_drawdown_fraction": "x"}})");
  EXPECT_THROW(rebal::parseConfig(doc), rebal::ConfigError);
}

TEST(ConfigLoaderTest, RejectsUnknownSellFloorBasis) {
  const auto doc = json::parse(R"({"sizing": {"sell_floor_basis": "equity"}})");
  EXPECT_THROW(rebal::parseConfig(doc), rebal::ConfigError);
  EXPECT_EQ(rebal::parseSellFloorBasis("available_cash"),
            rebal::SellFloorBasis::AvailableCash);
}

TEST(ConfigLoaderTest, RejectsOutOfRangeValues) {
  const char* bad[] = {
      R"({"risk": {"max_drawdown_fraction": 0}})",
      R"({"risk": {"max_single_asset_fraction": 1.5}})",
      R"({"sizing": {"usd_per_unit_return": -1}})",
      R"({"sizing": {"sell_floor_fraction": 2}})",
      R"({"sizing": {"cash_buffer_fraction": 0}})",
      R"({"normalizer": {"min_trade_usd": -1}})",
      R"({"harness": {"cycle_interval_seconds": 0}})",
      R"({"harness": {"price_history_capacity": 1}})",
  };
  for (const char* text : bad) {
    EXPECT_THROW(rebal::parseConfig(json::parse(text)), rebal::ConfigError)
        << text;
  }
}

TEST(ConfigLoaderTest, RejectsNonObjectRoot) {
  EXPECT_THROW(rebal::parseConfig(json::array()), rebal::ConfigError);
}

// -----------------------------------------------------------------------------
// 4. File loading.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MissingFileIsConfigError) {
  EXPECT_THROW(rebal::loadConfigFile("/nonexistent/rebal/engine.json"),
               rebal::ConfigError);
}

TEST(ConfigLoaderTest, LoadsFileAndRejectsMalformedFile) {
  const std::string good = ::testing::TempDir() + "rebal_engine_good.json";
  const std::string bad = ::testing::TempDir() + "rebal_engine_bad.json";
  {
    std::ofstream(good) << R"({"harness": {"symbols": ["SOL/USD"]}})";
    std::ofstream(bad) << "{ not json";
  }

  auto cfg = rebal::loadConfigFile(good);
  ASSERT_EQ(cfg.harness.symbols.size(), 1u);
  EXPECT_EQ(cfg.harness.symbols[0], "SOL/USD");

  EXPECT_THROW(rebal::loadConfigFile(bad), rebal::ConfigError);

  std::remove(good.c_str());
  std::remove(bad.c_str());
}

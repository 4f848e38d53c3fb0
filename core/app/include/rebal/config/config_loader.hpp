#pragma once

#include "rebal/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// The JSON document mirrors EngineConfig section by section. Every key is
// optional; a missing key keeps the default. Unknown keys are ignored.
//
//   {
//     "sizing":     { "usd_per_unit_return": 2000, "sell_floor_fraction": 0.5,
//                     "sell_floor_basis": "available_cash",
//                     "cash_buffer_fraction": 0.995,
//                     "clip_to_exposure_limit": true },
//     "normalizer": { "min_trade_usd": 50 },
//     "risk":       { "max_drawdown_fraction": 0.10,
//                     "max_single_asset_fraction": 0.35,
//                     "max_daily_loss_fraction": 0.04,
//                     "calibrate_peak_on_start": true },
//     "harness":    { "symbols": ["BTC/USD"], "initial_cash": 10000, ... }
//   }
//
// All functions throw ConfigError on malformed input: a type mismatch, an
// unreadable file, or a value that fails validateConfig().
// -----------------------------------------------------------------------------

EngineConfig parseConfig(const nlohmann::json& document);

EngineConfig loadConfigFile(const std::string& path);

// Range checks: fractions in (0, 1], positive scale and capacity, non-empty
// symbol list, non-negative cash.
void validateConfig(const EngineConfig& config);

SellFloorBasis parseSellFloorBasis(const std::string& text);

}  // namespace rebal

#pragma once

#include "rebal/domain/risk_limits.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// SellFloorBasis
// -----------------------------------------------------------------------------
// Which amount the sell-side target floor is measured against:
//
//   AvailableCash    target >= -cash * sell_floor_fraction. This is what the
//                    production bot has always done; it acts as a global
//                    floor rather than a per-asset one.
//   CurrentExposure  target >= -current_usd * sell_floor_fraction, i.e. the
//                    floor scales with the holding being sold.
// -----------------------------------------------------------------------------
enum class SellFloorBasis {
  AvailableCash,
  CurrentExposure,
};

// -----------------------------------------------------------------------------
// SizingConfig: PositionSizer constants
// -----------------------------------------------------------------------------
struct SizingConfig {
  /// USD of target exposure per unit of return (0.01 return → 20 USD at 2000).
  double usd_per_unit_return{2000.0};

  /// Fraction of the floor basis the target may go below zero by.
  double sell_floor_fraction{0.5};
  SellFloorBasis sell_floor_basis{SellFloorBasis::AvailableCash};

  /// Buys never spend more than this fraction of available cash.
  double cash_buffer_fraction{0.995};

  /// Clip each trade so current_usd + diff_usd stays within the RiskGovernor's
  /// single-asset cap.
  bool clip_to_exposure_limit{true};
};

// -----------------------------------------------------------------------------
// NormalizerConfig: OrderNormalizer constants
// -----------------------------------------------------------------------------
struct NormalizerConfig {
  /// Orders whose |diff_usd| is at or below this are dropped as noise.
  double min_trade_usd{50.0};
};

// -----------------------------------------------------------------------------
// HarnessConfig: settings used only by the runnable paper harness
// -----------------------------------------------------------------------------
struct HarnessConfig {
  std::vector<std::string> symbols;
  double initial_cash{10000.0};
  std::string cash_asset{"USD"};
  int cycle_interval_seconds{3600};
  std::size_t price_history_capacity{64};
  std::string exchange_info_path{"config/exchange_info.json"};
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig: the single configuration aggregate
// -----------------------------------------------------------------------------
//
// @brief  Every tunable threshold of the rebalancer in one place.
//
// @details
// Defaults reproduce the production bot's constants, so a default-constructed
// EngineConfig behaves exactly like the hard-coded original. ConfigLoader
// overlays values from a JSON file and validates the result.
//
// Thread model:
//   Plain value type. Copied into the RebalanceEngine at construction and
//   never mutated afterwards.
// -----------------------------------------------------------------------------
struct EngineConfig {
  SizingConfig sizing;
  NormalizerConfig normalizer;
  domain::RiskLimits risk;
  HarnessConfig harness;
};

}  // namespace rebal

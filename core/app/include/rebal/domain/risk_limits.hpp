#pragma once

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: portfolio-wide circuit-breaker thresholds
// -----------------------------------------------------------------------------
//
// @brief  The three hard limits evaluated by the RiskGovernor before any
//         order of a cycle is released, plus the start-up peak calibration
//         switch.
//
// @details
// All values are fractions, not percentages:
//
//   max_drawdown_fraction      (peak - equity) / peak above this suspends
//                              trading. 0.10 = 10 %.
//   max_single_asset_fraction  position_usd / equity above this for ANY
//                              symbol suspends trading. The same fraction
//                              caps each buy so a single order never pushes
//                              a symbol past it.
//   max_daily_loss_fraction    daily_pnl below -fraction * initial_cash
//                              suspends trading.
//
// calibrate_peak_on_start:
//   The peak is seeded with the initial cash. If the first observed equity
//   is already below that (fees, marks moved between funding and the first
//   cycle) the drawdown gate would trip immediately. When enabled, the first
//   evaluation of a session lowers the peak to the observed equity instead.
//
// Thread model:
//   Plain value type, copied into the RiskGovernor at construction.
// -----------------------------------------------------------------------------
struct RiskLimits {
  double max_drawdown_fraction{0.10};
  double max_single_asset_fraction{0.35};
  double max_daily_loss_fraction{0.04};
  bool calibrate_peak_on_start{true};
};

}  // namespace domain
}  // namespace rebal

#pragma once

#include "rebal/config/engine_config.hpp"
#include "rebal/domain/fault.hpp"
#include "rebal/domain/order.hpp"

#include <optional>
#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// SizingInput: everything the sizer needs for one symbol
// -----------------------------------------------------------------------------
//   return_fraction     momentum from the SignalCalculator
//   current_usd         notional currently held in the symbol
//   available_cash_usd  spendable cash from the account snapshot
//   price               latest price, must be > 0
//   held_quantity       units of the base asset held (0 when absent)
//   max_position_usd    single-asset cap from the RiskGovernor; nullopt
//                       disables the exposure clip
// -----------------------------------------------------------------------------
struct SizingInput {
  std::string symbol;
  double return_fraction{0.0};
  double current_usd{0.0};
  double available_cash_usd{0.0};
  double price{0.0};
  double held_quantity{0.0};
  std::optional<double> max_position_usd;
};

// -----------------------------------------------------------------------------
// PositionSizer
// -----------------------------------------------------------------------------
//
// @brief  Maps momentum to a target notional and computes the trade that
//         closes the gap, clipped so it can be funded and never goes short.
//
// @details
// Steps, in order:
//
//   1. target  = return_fraction * usd_per_unit_return
//   2. floor   : target = max(target, -basis * sell_floor_fraction), where
//                basis is available cash or current_usd depending on
//                SellFloorBasis.
//   3. diff    = target - current_usd
//   4. exposure: if max_position_usd is set and current + diff exceeds it,
//                diff = max_position_usd - current_usd.
//   5. buy     : diff <= available_cash * cash_buffer_fraction.
//   6. units   : raw_quantity = diff / price.
//   7. sell    : |raw_quantity| <= held_quantity.
//
// A non-positive or non-finite price produces an ArithmeticFault instead of a
// TradeIntent. A zero diff produces a no-op intent, not a fault.
//
// Thread model:
//   Immutable after construction; size() is const and reentrant.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(const SizingConfig& config);

  // Steps 1–2 only. Exposed so the floor can be tested on its own.
  double targetUsd(double return_fraction, double current_usd,
                   double available_cash_usd) const;

  domain::SymbolResult<domain::TradeIntent> size(const SizingInput& in) const;

  const SizingConfig& config() const { return config_; }

 private:
  SizingConfig config_;
};

}  // namespace rebal

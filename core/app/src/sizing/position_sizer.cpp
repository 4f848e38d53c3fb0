#include "rebal/sizing/position_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PositionSizer::PositionSizer(const SizingConfig& config) : config_(config) {}

// -----------------------------------------------------------------------------
// targetUsd: momentum scaling and sell-side floor
// -----------------------------------------------------------------------------
double PositionSizer::targetUsd(double return_fraction, double current_usd,
                                double available_cash_usd) const {
  const double raw_target = return_fraction * config_.usd_per_unit_return;

  const double basis = (config_.sell_floor_basis == SellFloorBasis::AvailableCash)
                           ? available_cash_usd
                           : current_usd;
  const double floor = -basis * config_.sell_floor_fraction;

  return std::max(raw_target, floor);
}

// -----------------------------------------------------------------------------
// size: target → diff → clips → units
// -----------------------------------------------------------------------------
domain::SymbolResult<domain::TradeIntent> PositionSizer::size(
    const SizingInput& in) const {
  if (!std::isfinite(in.price) || in.price <= 0.0) {
    std::ostringstream os;
    os << "cannot size with price " << in.price;
    std::cerr << "[PositionSizer] " << in.symbol << ": " << os.str() << "\n";
    return domain::SymbolFault{in.symbol, domain::FaultKind::ArithmeticFault,
                               os.str()};
  }

  domain::TradeIntent intent;
  intent.symbol = in.symbol;
  intent.reference_price = in.price;
  intent.target_usd =
      targetUsd(in.return_fraction, in.current_usd, in.available_cash_usd);

  double diff_usd = intent.target_usd - in.current_usd;

  // --- Single-asset exposure cap -------------------------------------------
  if (config_.clip_to_exposure_limit && in.max_position_usd.has_value() &&
      in.current_usd + diff_usd > *in.max_position_usd) {
    diff_usd = *in.max_position_usd - in.current_usd;
  }

  // --- Cash buffer: never deploy the last (1 - buffer) of cash -------------
  if (diff_usd > 0.0) {
    const double max_buyable =
        std::max(0.0, in.available_cash_usd) * config_.cash_buffer_fraction;
    if (diff_usd > max_buyable) {
      diff_usd = max_buyable;
    }
  }

  double quantity = diff_usd / in.price;

  // --- No shorting: a sell never exceeds what is held ----------------------
  if (diff_usd < 0.0) {
    const double held = std::max(0.0, in.held_quantity);
    if (-quantity > held) {
      quantity = -held;
    }
  }

  intent.diff_usd = diff_usd;
  intent.raw_quantity = quantity;
  intent.side = (diff_usd < 0.0) ? domain::Side::Sell : domain::Side::Buy;
  return intent;
}

}  // namespace rebal

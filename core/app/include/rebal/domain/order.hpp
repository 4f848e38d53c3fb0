#pragma once

#include <string>

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// TradeIntent: the raw trade the PositionSizer wants for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Gap between the momentum target and the current notional exposure,
//         translated into asset units at the current price.
//
// @details
// Sign convention:
//   diff_usd     > 0 → buy,  < 0 → sell, 0 → no-op.
//   raw_quantity carries the same sign as diff_usd. Its magnitude has
//                already been clipped by the cash buffer (buys) and by the
//                held quantity (sells), but not yet by venue rules.
//
// target_usd is kept for observability only; downstream stages act on
// diff_usd and raw_quantity.
//
// Lifetime: created and consumed within one rebalancing cycle.
// -----------------------------------------------------------------------------
struct TradeIntent {
  std::string symbol;
  double target_usd{0.0};       // Floored momentum target
  double diff_usd{0.0};         // Post-clip USD gap (signed)
  Side side{Side::Buy};
  double raw_quantity{0.0};     // Signed asset units before normalization
  double reference_price{0.0};  // Price used for the USD → units conversion

  bool isNoOp() const { return diff_usd == 0.0 || raw_quantity == 0.0; }
};

// -----------------------------------------------------------------------------
// NormalizedOrder: an order that satisfies the venue's quantity rules
// -----------------------------------------------------------------------------
//
// @brief  Output of the OrderNormalizer: side plus an unsigned quantity that
//         is a whole number of steps rounded to the symbol's precision.
//
// @details
// notional_usd is the absolute USD gap of the intent the order was sized
// from. The minimum-value filter is defined on that gap rather than on
// quantity × price, so carrying it lets an already-normalized order be fed
// through the normalizer again and come out unchanged.
//
// Lifetime: created by the normalizer, handed to OrderSubmission, then
// dropped at the end of the cycle.
// -----------------------------------------------------------------------------
struct NormalizedOrder {
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};          // Always positive
  double reference_price{0.0};
  double notional_usd{0.0};      // |diff_usd| of the originating intent
};

}  // namespace domain
}  // namespace rebal

#pragma once

#include <string>

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// RoundingMode
// -----------------------------------------------------------------------------
// How a venue rounds a quantity to its declared precision. The upstream
// exchange-info feed does not say which convention it applies, so it is
// carried per symbol and defaults to HalfUp (ties move away from zero).
// HalfEven resolves ties to the nearest even last digit.
// -----------------------------------------------------------------------------
enum class RoundingMode {
  HalfUp,
  HalfEven,
};

inline const char* toString(RoundingMode mode) {
  switch (mode) {
    case RoundingMode::HalfUp:   return "half_up";
    case RoundingMode::HalfEven: return "half_even";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// AssetRule: venue quantity constraints for one tradable pair
// -----------------------------------------------------------------------------
//
// @brief  Immutable per-symbol rule loaded once from the exchange-info
//         document and looked up by the OrderNormalizer on every cycle.
//
// @details
//   step_size           Smallest quantity increment the venue accepts.
//                       Always positive. Quantities are floored to a whole
//                       number of steps.
//   quantity_precision  Number of decimal places kept after step flooring.
//                       Non-negative.
//   rounding            Tie-breaking convention used for the precision step.
//
// Thread model:
//   Value type. The RuleRegistry owns the authoritative copies and hands out
//   copies; nothing mutates a rule after load.
// -----------------------------------------------------------------------------
struct AssetRule {
  std::string symbol;                          // Pair identifier ("BTC/USD")
  double step_size{1.0};                       // Quantity granularity
  int quantity_precision{0};                   // Decimal places retained
  RoundingMode rounding{RoundingMode::HalfUp};
};

}  // namespace domain
}  // namespace rebal

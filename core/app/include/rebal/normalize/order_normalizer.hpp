#pragma once

#include "rebal/config/engine_config.hpp"
#include "rebal/domain/asset_rule.hpp"
#include "rebal/domain/order.hpp"

#include <optional>

namespace rebal {

// -----------------------------------------------------------------------------
// OrderNormalizer
// -----------------------------------------------------------------------------
//
// @brief  Clamps a TradeIntent to the venue's quantity rules and drops trades
//         too small to be worth their fees.
//
// @details
// Applied in this fixed order:
//
//   1. Minimum value   |diff_usd| <= min_trade_usd → suppressed. The bound
//                      is exclusive: exactly 50 USD is suppressed.
//   2. Step floor      q = floor(|q| / step) * step. Works on the magnitude,
//                      so sells are floored toward zero as well and the
//                      result never exceeds what the sizer computed.
//   3. Precision       round q to quantity_precision decimals using the
//                      rule's RoundingMode. A rounded result larger than
//                      the sizer's |raw_quantity| is floored to the
//                      precision instead, so a sell of a full holding or a
//                      buy at the cash buffer is never rounded past it.
//   4. Zero check      q == 0 after 2–3 → suppressed.
//
// Suppression is returned as std::nullopt.
//
// Floating-point note:
//   Quantities like 1.23 are not exact in binary, so 1.23 / 0.01 can land a
//   hair below 123 and floor to 122. kStepEpsilon (in step units) absorbs
//   that noise. It is what makes normalize(normalize(x)) == normalize(x).
//
// Thread model:
//   Immutable after construction; all methods are const or static.
// -----------------------------------------------------------------------------
class OrderNormalizer {
 public:
  static constexpr double kStepEpsilon = 1e-9;

  explicit OrderNormalizer(const NormalizerConfig& config);

  std::optional<domain::NormalizedOrder> normalize(
      const domain::TradeIntent& intent, const domain::AssetRule& rule) const;

  // Re-applies the rules to an order that was already normalized. Returns the
  // same order for any input produced by normalize() with the same rule.
  std::optional<domain::NormalizedOrder> normalize(
      const domain::NormalizedOrder& order,
      const domain::AssetRule& rule) const;

  // Magnitude floor to a whole number of steps. Returns 0 for step <= 0.
  static double quantizeToStep(double quantity, double step_size);

  static double roundToPrecision(double quantity, int precision,
                                 domain::RoundingMode mode);

  // Truncates toward zero at quantity_precision decimals.
  static double floorToPrecision(double quantity, int precision);

  bool passesMinimumValue(double diff_usd) const;

 private:
  std::optional<double> clampQuantity(double quantity,
                                      const domain::AssetRule& rule) const;

  NormalizerConfig config_;
};

}  // namespace rebal

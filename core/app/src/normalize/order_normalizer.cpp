#include "rebal/normalize/order_normalizer.hpp"

#include <algorithm>
#include <cmath>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderNormalizer::OrderNormalizer(const NormalizerConfig& config)
    : config_(config) {}

// -----------------------------------------------------------------------------
// passesMinimumValue: strict comparison, the threshold itself is noise
// -----------------------------------------------------------------------------
bool OrderNormalizer::passesMinimumValue(double diff_usd) const {
  return std::abs(diff_usd) > config_.min_trade_usd;
}

// -----------------------------------------------------------------------------
// quantizeToStep
// -----------------------------------------------------------------------------
double OrderNormalizer::quantizeToStep(double quantity, double step_size) {
  if (!(step_size > 0.0) || !std::isfinite(quantity)) {
    return 0.0;
  }
  const double magnitude = std::abs(quantity);
  const double steps = std::floor(magnitude / step_size + kStepEpsilon);
  return steps * step_size;
}

// -----------------------------------------------------------------------------
// roundToPrecision
// -----------------------------------------------------------------------------
double OrderNormalizer::roundToPrecision(double quantity, int precision,
                                         domain::RoundingMode mode) {
  if (precision < 0) {
    precision = 0;
  }
  const double scale = std::pow(10.0, precision);
  const double scaled = quantity * scale;

  double rounded = 0.0;
  switch (mode) {
    case domain::RoundingMode::HalfUp:
      // std::round sends .5 away from zero.
      rounded = std::round(scaled);
      break;
    case domain::RoundingMode::HalfEven: {
      const double lower = std::floor(scaled);
      const double fraction = scaled - lower;
      if (fraction > 0.5) {
        rounded = lower + 1.0;
      } else if (fraction < 0.5) {
        rounded = lower;
      } else {
        rounded = (std::fmod(lower, 2.0) == 0.0) ? lower : lower + 1.0;
      }
      break;
    }
  }
  return rounded / scale;
}

// -----------------------------------------------------------------------------
// floorToPrecision
// -----------------------------------------------------------------------------
double OrderNormalizer::floorToPrecision(double quantity, int precision) {
  if (precision < 0) {
    precision = 0;
  }
  const double scale = std::pow(10.0, precision);
  return std::floor(quantity * scale + kStepEpsilon) / scale;
}

// -----------------------------------------------------------------------------
// clampQuantity: steps 2–4 on a magnitude
// -----------------------------------------------------------------------------
std::optional<double> OrderNormalizer::clampQuantity(
    double quantity, const domain::AssetRule& rule) const {
  const double limit = std::abs(quantity);
  const double stepped = quantizeToStep(quantity, rule.step_size);
  double rounded =
      roundToPrecision(stepped, rule.quantity_precision, rule.rounding);

  // Rounding up must not sell more than is held or spend past the buffer.
  const double unit = std::pow(10.0, -std::max(rule.quantity_precision, 0));
  if (rounded - limit > kStepEpsilon * unit) {
    rounded = floorToPrecision(stepped, rule.quantity_precision);
  }
  if (!(rounded > 0.0)) {
    return std::nullopt;
  }
  return rounded;
}

// -----------------------------------------------------------------------------
// normalize(TradeIntent)
// -----------------------------------------------------------------------------
std::optional<domain::NormalizedOrder> OrderNormalizer::normalize(
    const domain::TradeIntent& intent, const domain::AssetRule& rule) const {
  if (!passesMinimumValue(intent.diff_usd)) {
    return std::nullopt;
  }

  auto quantity = clampQuantity(intent.raw_quantity, rule);
  if (!quantity.has_value()) {
    return std::nullopt;
  }

  domain::NormalizedOrder order;
  order.symbol = intent.symbol;
  order.side = intent.raw_quantity < 0.0 ? domain::Side::Sell
                                         : domain::Side::Buy;
  order.quantity = *quantity;
  order.reference_price = intent.reference_price;
  order.notional_usd = std::abs(intent.diff_usd);
  return order;
}

// -----------------------------------------------------------------------------
// normalize(NormalizedOrder)
// -----------------------------------------------------------------------------
std::optional<domain::NormalizedOrder> OrderNormalizer::normalize(
    const domain::NormalizedOrder& order,
    const domain::AssetRule& rule) const {
  if (!passesMinimumValue(order.notional_usd)) {
    return std::nullopt;
  }

  auto quantity = clampQuantity(order.quantity, rule);
  if (!quantity.has_value()) {
    return std::nullopt;
  }

  domain::NormalizedOrder out = order;
  out.quantity = *quantity;
  return out;
}

}  // namespace rebal

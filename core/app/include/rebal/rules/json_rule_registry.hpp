#pragma once

#include "rebal/domain/asset_rule.hpp"
#include "rebal/rules/i_rule_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// JsonRuleRegistry: AssetRules parsed from a venue exchange-info document
// -----------------------------------------------------------------------------
//
// @brief  Loads the "TradePairs" section of an exchange-info JSON once and
//         serves immutable AssetRule copies.
//
// @details
// Expected shape (extra keys ignored):
//
//   { "TradePairs": {
//       "BTC/USD": { "AmountPrecision": 5 },
//       "DOGE/USD": { "AmountPrecision": 0, "StepSize": 1,
//                     "Rounding": "half_even" } } }
//
//   AmountPrecision  required, non-negative integer
//   StepSize         optional, positive; defaults to 10^-AmountPrecision,
//                    which is how the venue's own precision field is meant
//                    to be read when it publishes no lot-size filter
//   Rounding         optional, "half_up" (default) or "half_even"
//
// Any violation throws ConfigError naming the pair, so a bad document stops
// start-up instead of producing mis-sized orders later.
//
// Thread model:
//   Immutable after construction; concurrent reads need no locking.
// -----------------------------------------------------------------------------
class JsonRuleRegistry final : public IRuleRegistry {
 public:
  explicit JsonRuleRegistry(const nlohmann::json& exchange_info);

  static JsonRuleRegistry fromFile(const std::string& path);

  domain::AssetRule getRule(const std::string& symbol) const override;
  bool hasRule(const std::string& symbol) const override;

  std::size_t size() const { return rules_.size(); }
  std::vector<std::string> symbols() const;

  static domain::RoundingMode parseRounding(const std::string& text);

 private:
  static domain::AssetRule parsePair(const std::string& symbol,
                                     const nlohmann::json& conf);

  std::unordered_map<std::string, domain::AssetRule> rules_;
};

}  // namespace rebal

#include "rebal/rules/json_rule_registry.hpp"
#include "rebal/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>

namespace rebal {

// -----------------------------------------------------------------------------
// parseRounding
// -----------------------------------------------------------------------------
domain::RoundingMode JsonRuleRegistry::parseRounding(const std::string& text) {
  if (text == "half_up") {
    return domain::RoundingMode::HalfUp;
  }
  if (text == "half_even") {
    return domain::RoundingMode::HalfEven;
  }
  throw ConfigError("unknown rounding mode: " + text);
}

// -----------------------------------------------------------------------------
// parsePair: one TradePairs entry → AssetRule
// -----------------------------------------------------------------------------
domain::AssetRule JsonRuleRegistry::parsePair(const std::string& symbol,
                                              const nlohmann::json& conf) {
  domain::AssetRule rule;
  rule.symbol = symbol;

  try {
    rule.quantity_precision = conf.at("AmountPrecision").get<int>();
    if (rule.quantity_precision < 0) {
      throw ConfigError(symbol + ": AmountPrecision must be non-negative");
    }

    if (conf.contains("StepSize")) {
      rule.step_size = conf.at("StepSize").get<double>();
    } else {
      rule.step_size = std::pow(10.0, -rule.quantity_precision);
    }
    if (!(rule.step_size > 0.0) || !std::isfinite(rule.step_size)) {
      throw ConfigError(symbol + ": StepSize must be positive");
    }

    if (conf.contains("Rounding")) {
      rule.rounding = parseRounding(conf.at("Rounding").get<std::string>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(symbol + ": invalid trade pair entry: " + e.what());
  }

  return rule;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
JsonRuleRegistry::JsonRuleRegistry(const nlohmann::json& exchange_info) {
  if (!exchange_info.is_object() || !exchange_info.contains("TradePairs") ||
      !exchange_info.at("TradePairs").is_object()) {
    throw ConfigError("exchange info has no TradePairs object");
  }

  for (const auto& [symbol, conf] : exchange_info.at("TradePairs").items()) {
    rules_.emplace(symbol, parsePair(symbol, conf));
  }

  std::cout << "[JsonRuleRegistry] Loaded " << rules_.size()
            << " trade pair rule(s).\n";
}

// -----------------------------------------------------------------------------
// fromFile
// -----------------------------------------------------------------------------
JsonRuleRegistry JsonRuleRegistry::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open exchange info file: " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }
  return JsonRuleRegistry(document);
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
domain::AssetRule JsonRuleRegistry::getRule(const std::string& symbol) const {
  auto it = rules_.find(symbol);
  if (it == rules_.end()) {
    throw UnknownSymbolError(symbol);
  }
  return it->second;
}

bool JsonRuleRegistry::hasRule(const std::string& symbol) const {
  return rules_.count(symbol) != 0;
}

std::vector<std::string> JsonRuleRegistry::symbols() const {
  std::vector<std::string> out;
  out.reserve(rules_.size());
  for (const auto& [symbol, rule] : rules_) {
    out.push_back(symbol);
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace rebal

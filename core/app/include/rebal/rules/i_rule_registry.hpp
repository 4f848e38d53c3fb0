#pragma once

#include "rebal/domain/asset_rule.hpp"

#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// IRuleRegistry: lookup of per-symbol venue quantity rules
// -----------------------------------------------------------------------------
// Rules are loaded once and immutable afterwards, so implementations are
// safe for concurrent reads without locking.
// -----------------------------------------------------------------------------
class IRuleRegistry {
 public:
  virtual ~IRuleRegistry() = default;

  // @throws UnknownSymbolError if no rule exists for symbol.
  virtual domain::AssetRule getRule(const std::string& symbol) const = 0;

  virtual bool hasRule(const std::string& symbol) const = 0;
};

}  // namespace rebal

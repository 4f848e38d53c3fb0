#pragma once

#include "rebal/domain/fault.hpp"
#include "rebal/market/i_price_feed.hpp"
#include "rebal/rules/i_rule_registry.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// SignalBatch: momentum for every tracked symbol, plus what went wrong
// -----------------------------------------------------------------------------
//
// @details
//   momentum       symbol → return_fraction. Contains every symbol that has
//                  an AssetRule; symbols that faulted are present with 0.0.
//   latest_price   symbol → most recent price, only for symbols whose
//                  momentum was computed successfully.
//   faults         one entry per skipped symbol.
//
// A symbol is tradable this cycle iff it has a latest price. Faulted symbols
// keep their 0.0 momentum for reporting but must not be rebalanced: a zero
// target would otherwise liquidate a holding just because its feed hiccupped.
// -----------------------------------------------------------------------------
struct SignalBatch {
  std::map<std::string, double> momentum;
  std::map<std::string, double> latest_price;
  std::vector<domain::SymbolFault> faults;

  bool isTradable(const std::string& symbol) const {
    return latest_price.count(symbol) != 0;
  }
};

// -----------------------------------------------------------------------------
// SignalCalculator
// -----------------------------------------------------------------------------
//
// @brief  Turns the two most recent prices of each symbol into a momentum
//         value.
//
// @details
// Per symbol, in this order:
//   1. No AssetRule                → UnknownSymbol fault, symbol left out
//                                    of the batch entirely.
//   2. Fewer than 2 price points   → DataUnavailable fault, momentum 0.
//   3. Previous or latest price
//      zero / negative / non-finite→ ArithmeticFault, momentum 0.
//   4. Otherwise momentum = latest / previous - 1.
//
// Each symbol is processed inside its own try block. Whatever the price feed
// throws for one symbol is recorded as that symbol's fault; the loop moves on
// to the next one. The result does not depend on the order of `symbols`.
//
// Thread model:
//   Stateless apart from the collaborator references; compute() is const.
//   Called on the cycle thread.
//
// Ownership:
//   Holds non-owning references. Both collaborators must outlive it.
// -----------------------------------------------------------------------------
class SignalCalculator {
 public:
  // Number of points requested from the feed per symbol.
  static constexpr std::size_t kLookback = 2;

  SignalCalculator(const IPriceFeed& feed, const IRuleRegistry& rules);

  SignalBatch compute(const std::vector<std::string>& symbols) const;

  // -------------------------------------------------------------------------
  // computeReturn(previous, latest)
  // -------------------------------------------------------------------------
  // @return latest / previous - 1, or std::nullopt when previous <= 0 or
  //         either input (or the result) is not finite.
  // Pure; identical inputs always give identical output.
  // -------------------------------------------------------------------------
  static std::optional<double> computeReturn(double previous, double latest);

 private:
  const IPriceFeed& feed_;
  const IRuleRegistry& rules_;
};

}  // namespace rebal

#pragma once

#include <cstdint>
#include <string>

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// PricePoint
// -----------------------------------------------------------------------------
// One observed price for a symbol. The engine only ever needs the two most
// recent points per cycle; the PriceHistoryStore keeps a bounded window.
// timestamp_ms is epoch milliseconds, matching ITimeProvider::now_ms().
// -----------------------------------------------------------------------------
struct PricePoint {
  std::int64_t timestamp_ms{0};
  double price{0.0};
};

// -----------------------------------------------------------------------------
// baseAsset(symbol)
// -----------------------------------------------------------------------------
// Pairs are written "BASE/QUOTE" ("ETH/USD"). Balances are keyed by the base
// asset, so the account layer needs the part before the slash. A symbol with
// no slash is its own base asset.
// -----------------------------------------------------------------------------
inline std::string baseAsset(const std::string& symbol) {
  auto slash = symbol.find('/');
  return slash == std::string::npos ? symbol : symbol.substr(0, slash);
}

}  // namespace domain
}  // namespace rebal

#pragma once

#include <string>
#include <unordered_map>

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// AccountSnapshot: everything the decision function needs from the account
// -----------------------------------------------------------------------------
//
// @details
// Captured once at the start of a cycle from the AccountQuery collaborator so
// the decision is made against a single consistent view.
//
//   balances       base asset → units held ("BTC" → 0.5). Missing = 0.
//   positions_usd  symbol → current notional ("BTC/USD" → 31000.0).
//   total_equity   cash + Σ positions_usd, as reported by the account.
//   available_cash spendable quote currency.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  std::unordered_map<std::string, double> balances;
  std::unordered_map<std::string, double> positions_usd;
  double total_equity_usd{0.0};
  double available_cash_usd{0.0};

  double balanceOf(const std::string& asset) const {
    auto it = balances.find(asset);
    return it != balances.end() ? it->second : 0.0;
  }

  double positionUsd(const std::string& symbol) const {
    auto it = positions_usd.find(symbol);
    return it != positions_usd.end() ? it->second : 0.0;
  }
};

}  // namespace domain
}  // namespace rebal

#pragma once

#include <string>
#include <unordered_map>

namespace rebal {

// -----------------------------------------------------------------------------
// IAccountQuery: read-only view of the trading account
// -----------------------------------------------------------------------------
//
// @brief  Balances and marked-to-market values the engine snapshots at the
//         start of every cycle.
//
// @details
//   getBalances()          base asset → units ("BTC" → 0.25, "USD" → 9000).
//   getPositionsUsd()      symbol → USD notional for tracked symbols.
//   getTotalEquityUsd()    cash plus every position's notional.
//   getAvailableCashUsd()  spendable quote currency.
//
// Implementations may throw std::runtime_error when the account cannot be
// read; the engine then aborts that cycle without trading.
// -----------------------------------------------------------------------------
class IAccountQuery {
 public:
  virtual ~IAccountQuery() = default;

  virtual std::unordered_map<std::string, double> getBalances() const = 0;
  virtual std::unordered_map<std::string, double> getPositionsUsd() const = 0;
  virtual double getTotalEquityUsd() const = 0;
  virtual double getAvailableCashUsd() const = 0;
};

}  // namespace rebal

#pragma once

#include "rebal/execution/i_account_query.hpp"
#include "rebal/execution/i_order_submission.hpp"
#include "rebal/market/price_history_store.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// PaperAccount: simulated spot account for the paper harness
// -----------------------------------------------------------------------------
//
// @brief  Implements both account collaborators against in-memory balances:
//         IAccountQuery reads them, IOrderSubmission fills orders at the
//         latest recorded price.
//
// @details
// Balances are keyed by asset: the cash asset ("USD" by default) and the
// base asset of each tracked symbol ("BTC" for "BTC/USD").
//
// Valuation:
//   positions_usd[symbol] = balance(base) * lastPrice(symbol). A symbol with
//   no recorded price is valued at 0 and left out of the map.
//
// Fills (all-or-nothing, no partials, no fees):
//   Buy   cost = qty * price; rejected with ExecutionError if cost exceeds
//         the cash balance.
//   Sell  rejected with ExecutionError if qty exceeds the base balance.
//   Fill price is the store's last price, falling back to the order's
//   reference price when the store has none. A fill price <= 0 is rejected.
//
// Thread model:
//   Every method locks mutex_, so the IPC thread can read STATUS while the
//   cycle thread submits. The PriceHistoryStore synchronizes itself.
//
// Ownership:
//   Holds a non-owning reference to the PriceHistoryStore, which must
//   outlive the account.
// -----------------------------------------------------------------------------
class PaperAccount final : public IAccountQuery, public IOrderSubmission {
 public:
  PaperAccount(const PriceHistoryStore& prices,
               std::vector<std::string> symbols, double initial_cash,
               std::string cash_asset = "USD");

  std::unordered_map<std::string, double> getBalances() const override;
  std::unordered_map<std::string, double> getPositionsUsd() const override;
  double getTotalEquityUsd() const override;
  double getAvailableCashUsd() const override;

  void submit(const domain::NormalizedOrder& order) override;

  // Overwrites one balance. Used to seed holdings from an earlier session.
  void setBalance(const std::string& asset, double quantity);

  double balance(const std::string& asset) const;

  std::size_t fillCount() const;

 private:
  std::unordered_map<std::string, double> positionsUsdLocked() const;

  const PriceHistoryStore& prices_;
  const std::vector<std::string> symbols_;
  const std::string cash_asset_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> balances_;
  std::size_t fills_{0};
};

}  // namespace rebal

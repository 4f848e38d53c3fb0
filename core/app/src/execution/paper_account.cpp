#include "rebal/execution/paper_account.hpp"
#include "rebal/domain/errors.hpp"
#include "rebal/domain/market_data.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PaperAccount::PaperAccount(const PriceHistoryStore& prices,
                           std::vector<std::string> symbols,
                           double initial_cash, std::string cash_asset)
    : prices_(prices),
      symbols_(std::move(symbols)),
      cash_asset_(std::move(cash_asset)) {
  balances_[cash_asset_] = initial_cash;
}

// -----------------------------------------------------------------------------
// Balances
// -----------------------------------------------------------------------------
std::unordered_map<std::string, double> PaperAccount::getBalances() const {
  std::lock_guard lock(mutex_);
  return balances_;
}

void PaperAccount::setBalance(const std::string& asset, double quantity) {
  std::lock_guard lock(mutex_);
  balances_[asset] = quantity;
}

double PaperAccount::balance(const std::string& asset) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(asset);
  return it != balances_.end() ? it->second : 0.0;
}

std::size_t PaperAccount::fillCount() const {
  std::lock_guard lock(mutex_);
  return fills_;
}

// -----------------------------------------------------------------------------
// positionsUsdLocked: caller holds mutex_
// -----------------------------------------------------------------------------
std::unordered_map<std::string, double> PaperAccount::positionsUsdLocked()
    const {
  std::unordered_map<std::string, double> out;
  for (const auto& symbol : symbols_) {
    auto it = balances_.find(domain::baseAsset(symbol));
    if (it == balances_.end() || it->second == 0.0) {
      continue;
    }
    auto price = prices_.lastPrice(symbol);
    if (!price.has_value()) {
      continue;
    }
    out[symbol] = it->second * *price;
  }
  return out;
}

std::unordered_map<std::string, double> PaperAccount::getPositionsUsd() const {
  std::lock_guard lock(mutex_);
  return positionsUsdLocked();
}

double PaperAccount::getTotalEquityUsd() const {
  std::lock_guard lock(mutex_);
  double total = 0.0;
  auto cash = balances_.find(cash_asset_);
  if (cash != balances_.end()) {
    total += cash->second;
  }
  for (const auto& [symbol, value] : positionsUsdLocked()) {
    total += value;
  }
  return total;
}

double PaperAccount::getAvailableCashUsd() const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(cash_asset_);
  return it != balances_.end() ? it->second : 0.0;
}

// -----------------------------------------------------------------------------
// submit: immediate all-or-nothing fill
// -----------------------------------------------------------------------------
void PaperAccount::submit(const domain::NormalizedOrder& order) {
  if (!(order.quantity > 0.0)) {
    throw ExecutionError("order quantity must be positive for " +
                         order.symbol);
  }

  const double price =
      prices_.lastPrice(order.symbol).value_or(order.reference_price);
  if (!(price > 0.0)) {
    throw ExecutionError("no valid fill price for " + order.symbol);
  }

  const std::string asset = domain::baseAsset(order.symbol);

  std::lock_guard lock(mutex_);
  double& cash = balances_[cash_asset_];
  double& held = balances_[asset];

  if (order.side == domain::Side::Buy) {
    const double cost = order.quantity * price;
    if (cost > cash) {
      std::ostringstream os;
      os << "insufficient " << cash_asset_ << " for " << order.symbol
         << ": need " << cost << ", have " << cash;
      throw ExecutionError(os.str());
    }
    cash -= cost;
    held += order.quantity;
  } else {
    if (order.quantity > held) {
      std::ostringstream os;
      os << "insufficient " << asset << ": sell " << order.quantity
         << ", have " << held;
      throw ExecutionError(os.str());
    }
    cash += order.quantity * price;
    held -= order.quantity;
  }

  ++fills_;
  std::cout << "[PaperAccount] Filled " << domain::toString(order.side) << " "
            << order.quantity << " " << order.symbol << " @ " << price
            << " | " << cash_asset_ << "=" << cash << "\n";
}

}  // namespace rebal

#pragma once

#include "rebal/domain/market_data.hpp"
#include "rebal/market/i_price_feed.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// PriceHistoryStore: bounded in-memory price history per symbol
// -----------------------------------------------------------------------------
//
// @brief  IPriceFeed implementation fed by the market data gateway (or by
//         tests) and read by the SignalCalculator and the PaperAccount.
//
// @details
// Each symbol keeps at most `capacity` points, oldest first. Points must
// arrive in timestamp order per symbol:
//
//   newer timestamp      appended (oldest point evicted when full)
//   same timestamp       replaces the latest point (a corrected print)
//   older timestamp      rejected, record() returns false
//
// Non-positive or non-finite prices are stored as given; rejecting them is
// the SignalCalculator's job, which reports an ArithmeticFault for them.
//
// Thread model:
//   record() takes a unique lock, readers take a shared lock, so the gateway
//   thread can write while the cycle and IPC threads read.
// -----------------------------------------------------------------------------
class PriceHistoryStore final : public IPriceFeed {
 public:
  explicit PriceHistoryStore(std::size_t capacity_per_symbol = 64);

  bool record(const std::string& symbol, const domain::PricePoint& point);

  std::vector<domain::PricePoint> getRecentPrices(
      const std::string& symbol, std::size_t n) const override;

  std::optional<double> lastPrice(const std::string& symbol) const;

  std::size_t size(const std::string& symbol) const;

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::deque<domain::PricePoint>> history_;
};

}  // namespace rebal

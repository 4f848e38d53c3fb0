#include "rebal/market/price_history_store.hpp"
#include "rebal/domain/errors.hpp"

#include <algorithm>
#include <cstddef>
#include <mutex>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PriceHistoryStore::PriceHistoryStore(std::size_t capacity_per_symbol)
    : capacity_(std::max<std::size_t>(capacity_per_symbol, 2)) {}

// -----------------------------------------------------------------------------
// record
// -----------------------------------------------------------------------------
bool PriceHistoryStore::record(const std::string& symbol,
                               const domain::PricePoint& point) {
  std::unique_lock lock(mutex_);
  auto& series = history_[symbol];

  if (!series.empty()) {
    const auto last_ts = series.back().timestamp_ms;
    if (point.timestamp_ms < last_ts) {
      return false;
    }
    if (point.timestamp_ms == last_ts) {
      series.back() = point;
      return true;
    }
  }

  series.push_back(point);
  while (series.size() > capacity_) {
    series.pop_front();
  }
  return true;
}

// -----------------------------------------------------------------------------
// getRecentPrices
// -----------------------------------------------------------------------------
std::vector<domain::PricePoint> PriceHistoryStore::getRecentPrices(
    const std::string& symbol, std::size_t n) const {
  std::shared_lock lock(mutex_);

  auto it = history_.find(symbol);
  const std::size_t available = (it == history_.end()) ? 0 : it->second.size();
  if (available < n) {
    throw DataUnavailableError(symbol, n, available);
  }

  const auto& series = it->second;
  return std::vector<domain::PricePoint>(
      series.end() - static_cast<std::ptrdiff_t>(n), series.end());
}

// -----------------------------------------------------------------------------
// lastPrice
// -----------------------------------------------------------------------------
std::optional<double> PriceHistoryStore::lastPrice(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(symbol);
  if (it == history_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back().price;
}

// -----------------------------------------------------------------------------
// size
// -----------------------------------------------------------------------------
std::size_t PriceHistoryStore::size(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(symbol);
  return it == history_.end() ? 0 : it->second.size();
}

}  // namespace rebal

#pragma once

#include "rebal/domain/market_data.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rebal {

// -----------------------------------------------------------------------------
// IPriceFeed: source of recent prices for the SignalCalculator
// -----------------------------------------------------------------------------
//
// @brief  Returns already-fetched price history. Implementations never block
//         on network I/O inside a cycle; fetching is the scheduler's job.
//
// Thread model:
//   getRecentPrices() may be called from the cycle thread while another
//   thread appends ticks. Implementations synchronize internally.
// -----------------------------------------------------------------------------
class IPriceFeed {
 public:
  virtual ~IPriceFeed() = default;

  // -------------------------------------------------------------------------
  // getRecentPrices(symbol, n)
  // -------------------------------------------------------------------------
  // @return The n most recent points for symbol, oldest first.
  // @throws DataUnavailableError if fewer than n points are held.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::PricePoint> getRecentPrices(
      const std::string& symbol, std::size_t n) const = 0;
};

}  // namespace rebal

#include "rebal/signal/signal_calculator.hpp"
#include "rebal/domain/errors.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SignalCalculator::SignalCalculator(const IPriceFeed& feed,
                                   const IRuleRegistry& rules)
    : feed_(feed), rules_(rules) {}

// -----------------------------------------------------------------------------
// computeReturn
// -----------------------------------------------------------------------------
std::optional<double> SignalCalculator::computeReturn(double previous,
                                                      double latest) {
  if (!std::isfinite(previous) || !std::isfinite(latest) || previous <= 0.0) {
    return std::nullopt;
  }
  double ret = latest / previous - 1.0;
  if (!std::isfinite(ret)) {
    return std::nullopt;
  }
  return ret;
}

// -----------------------------------------------------------------------------
// compute: one isolated evaluation per symbol
// -----------------------------------------------------------------------------
SignalBatch SignalCalculator::compute(
    const std::vector<std::string>& symbols) const {
  SignalBatch batch;

  auto recordFault = [&batch](const std::string& symbol, domain::FaultKind kind,
                              std::string detail) {
    std::cerr << "[SignalCalculator] " << domain::toString(kind) << " for "
              << symbol << ": " << detail << "\n";
    batch.faults.push_back(domain::SymbolFault{symbol, kind, std::move(detail)});
  };

  for (const auto& symbol : symbols) {
    // --- Configuration check: no rule, no trading, not even a momentum entry
    if (!rules_.hasRule(symbol)) {
      recordFault(symbol, domain::FaultKind::UnknownSymbol,
                  "symbol has no asset rule, skipped");
      continue;
    }

    batch.momentum[symbol] = 0.0;

    try {
      auto points = feed_.getRecentPrices(symbol, kLookback);
      if (points.size() < kLookback) {
        std::ostringstream os;
        os << "only " << points.size() << " price point(s)";
        recordFault(symbol, domain::FaultKind::DataUnavailable, os.str());
        continue;
      }

      const double previous = points[points.size() - 2].price;
      const double latest = points.back().price;

      auto ret = computeReturn(previous, latest);
      if (!ret.has_value() || !(latest > 0.0)) {
        std::ostringstream os;
        os << "invalid prices previous=" << previous << " latest=" << latest;
        recordFault(symbol, domain::FaultKind::ArithmeticFault, os.str());
        continue;
      }

      batch.momentum[symbol] = *ret;
      batch.latest_price[symbol] = latest;
    } catch (const DataUnavailableError& e) {
      recordFault(symbol, domain::FaultKind::DataUnavailable, e.what());
    } catch (const std::exception& e) {
      // Anything else the feed throws is treated like a bad price: this
      // symbol sits the cycle out, the others carry on.
      recordFault(symbol, domain::FaultKind::ArithmeticFault, e.what());
    }
  }

  return batch;
}

}  // namespace rebal

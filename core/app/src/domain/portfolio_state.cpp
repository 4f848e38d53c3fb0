#include "rebal/domain/portfolio_state.hpp"

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// fromInitialCash
// -----------------------------------------------------------------------------
PortfolioState PortfolioState::fromInitialCash(double initial_cash) {
  PortfolioState state;
  state.initial_cash = initial_cash;
  state.peak_equity = initial_cash;
  state.day_start_equity = initial_cash;
  state.daily_pnl = 0.0;
  return state;
}

// -----------------------------------------------------------------------------
// observeEquity
// -----------------------------------------------------------------------------
void PortfolioState::observeEquity(double total_equity) {
  daily_pnl = total_equity - day_start_equity;
}

// -----------------------------------------------------------------------------
// startNewDay
// -----------------------------------------------------------------------------
void PortfolioState::startNewDay(double total_equity) {
  day_start_equity = total_equity;
  daily_pnl = 0.0;
}

// -----------------------------------------------------------------------------
// resetPeak
// -----------------------------------------------------------------------------
void PortfolioState::resetPeak(double total_equity) {
  peak_equity = total_equity;
}

}  // namespace domain
}  // namespace rebal

#pragma once

namespace rebal {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioState: risk state carried from one cycle to the next
// -----------------------------------------------------------------------------
//
// @brief  Session-scoped numbers the RiskGovernor needs: the equity peak for
//         the drawdown gate and today's P&L for the daily loss gate.
//
// @details
// Invariants:
//   - peak_equity never decreases except through resetPeak() (or the
//     one-time start-up calibration performed by the RiskGovernor).
//   - daily_pnl is always total_equity - day_start_equity as of the last
//     observeEquity() call.
//
// Lifecycle is explicit. Nothing in here looks at the wall clock:
//   startNewDay()  moves the day baseline and zeroes daily_pnl. The harness
//                  calls it on a UTC date change or on an operator command.
//   resetPeak()    re-anchors the peak, for example after a deposit.
//
// Thread model:
//   Not synchronized. The RebalanceEngine owns the single instance and only
//   touches it while holding its cycle mutex.
// -----------------------------------------------------------------------------
struct PortfolioState {
  double peak_equity{0.0};
  double daily_pnl{0.0};
  double initial_cash{0.0};
  double day_start_equity{0.0};
  bool peak_calibrated{false};  // Start-up calibration already considered

  // Seeds peak, day baseline and initial cash from the funded cash amount.
  static PortfolioState fromInitialCash(double initial_cash);

  // Recomputes daily_pnl against the current day baseline.
  void observeEquity(double total_equity);

  // New trading day: baseline := total_equity, daily_pnl := 0. The peak is
  // left alone.
  void startNewDay(double total_equity);

  // Re-anchors the peak to total_equity.
  void resetPeak(double total_equity);
};

}  // namespace domain
}  // namespace rebal

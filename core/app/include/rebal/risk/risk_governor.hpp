#pragma once

#include "rebal/domain/portfolio_state.hpp"
#include "rebal/domain/risk_limits.hpp"
#include "rebal/domain/risk_verdict.hpp"
#include "rebal/eventbus/event_bus.hpp"
#include "rebal/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace rebal {

// -----------------------------------------------------------------------------
// RiskGovernor
// -----------------------------------------------------------------------------
//
// @brief  Portfolio-level circuit breaker consulted once per cycle before any
//         order is released, plus the per-order single-asset cap.
//
// @details
// evaluate() runs a fixed chain of independent gates. Every gate is
// evaluated on every call; any failure fails the whole cycle, and the first
// failure in chain order is reported as RiskVerdict::breached.
//
//   0. OperatorHalt         haltTrading() was called and not yet resumed.
//   1. InvalidEquity        total equity <= 0 or peak <= 0: the ratio gates
//                           below are undefined for this snapshot.
//   2. MaxDrawdown          peak = max(peak, equity), then fail when
//                           (peak - equity) / peak > max_drawdown_fraction.
//   3. SingleAssetExposure  fail when value / equity > max_single_asset_fraction
//                           for ANY symbol. Every symbol is checked and every
//                           offender is listed.
//   4. DailyLoss            fail when daily_pnl < -max_daily_loss_fraction *
//                           initial_cash.
//
// The peak update in gate 2 happens even when another gate fails, so the
// drawdown is always measured from the true historical high. Before the
// first update of a session the optional start-up calibration may lower the
// peak once (see RiskLimits::calibrate_peak_on_start).
//
// Each breach is published as a RiskViolationEvent and logged to stderr.
//
// State:
//   The governor itself holds only the limits and the operator halt flag.
//   PortfolioState is owned by the caller and passed in by reference, so the
//   lifecycle resets (new day, peak reset) stay explicit.
//
// Thread model:
//   evaluate() runs on the cycle thread. haltTrading()/resumeTrading() may be
//   called from the IPC thread; the flag is atomic.
//
// Ownership:
//   Does not own the EventBus or the time provider; both must outlive it.
// -----------------------------------------------------------------------------
class RiskGovernor {
 public:
  RiskGovernor(EventBus& bus, const domain::RiskLimits& limits,
               const ITimeProvider& clock);

  RiskGovernor(const RiskGovernor&) = delete;
  RiskGovernor& operator=(const RiskGovernor&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(state, total_equity, positions_usd, cycle_id)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs the gate chain against one account snapshot.
  //
  // @param  state          Session risk state. peak_equity is updated.
  // @param  total_equity   Marked-to-market equity for this cycle.
  // @param  positions_usd  symbol → notional for every held symbol.
  // @param  cycle_id       Stamped on published RiskViolationEvents.
  //
  // @return RiskVerdict with every breach in chain order.
  //
  // Side-effects: mutates state.peak_equity (and state.peak_calibrated),
  //               publishes one RiskViolationEvent per breach.
  // -------------------------------------------------------------------------
  domain::RiskVerdict evaluate(
      domain::PortfolioState& state, double total_equity,
      const std::unordered_map<std::string, double>& positions_usd,
      std::uint64_t cycle_id = 0);

  // Largest notional a single symbol may reach after a trade.
  double maxPositionUsd(double total_equity) const;

  // Kill switch. While halted every verdict fails with OperatorHalt.
  void haltTrading();
  void resumeTrading();
  bool isHalted() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  void calibratePeak(domain::PortfolioState& state, double total_equity) const;

  void recordBreach(domain::RiskVerdict& verdict, domain::RiskBreach breach,
                    std::uint64_t cycle_id);

  EventBus& bus_;
  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;
  std::atomic<bool> halted_{false};
};

}  // namespace rebal

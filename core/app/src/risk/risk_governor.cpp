#include "rebal/risk/risk_governor.hpp"
#include "rebal/events/risk_violation_event.hpp"
#include "rebal/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <map>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RiskGovernor::RiskGovernor(EventBus& bus, const domain::RiskLimits& limits,
                           const ITimeProvider& clock)
    : bus_(bus), limits_(limits), clock_(clock) {}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void RiskGovernor::haltTrading() {
  halted_.store(true);
  std::cerr << "[RiskGovernor] Operator halt engaged. Trading suspended.\n";
}

void RiskGovernor::resumeTrading() {
  halted_.store(false);
  std::cout << "[RiskGovernor] Operator halt released.\n";
}

bool RiskGovernor::isHalted() const { return halted_.load(); }

// -----------------------------------------------------------------------------
// maxPositionUsd
// -----------------------------------------------------------------------------
double RiskGovernor::maxPositionUsd(double total_equity) const {
  return std::max(0.0, total_equity) * limits_.max_single_asset_fraction;
}

// -----------------------------------------------------------------------------
// calibratePeak: one-time start-up adjustment
// -----------------------------------------------------------------------------
void RiskGovernor::calibratePeak(domain::PortfolioState& state,
                                 double total_equity) const {
  if (state.peak_calibrated) {
    return;
  }
  state.peak_calibrated = true;

  if (limits_.calibrate_peak_on_start &&
      state.peak_equity == state.initial_cash &&
      total_equity < state.initial_cash && total_equity > 0.0) {
    std::cout << "[RiskGovernor] Peak calibrated from " << state.peak_equity
              << " to first observed equity " << total_equity << "\n";
    state.peak_equity = total_equity;
  }
}

// -----------------------------------------------------------------------------
// recordBreach: append, log, publish
// -----------------------------------------------------------------------------
void RiskGovernor::recordBreach(domain::RiskVerdict& verdict,
                                domain::RiskBreach breach,
                                std::uint64_t cycle_id) {
  if (verdict.breaches.empty()) {
    verdict.breached = breach.rule;
  }
  verdict.passed = false;

  std::cerr << "[RiskGovernor] BREACH " << domain::toString(breach.rule);
  if (!breach.symbol.empty()) {
    std::cerr << " symbol=" << breach.symbol;
  }
  std::cerr << " value=" << breach.current_value
            << " limit=" << breach.limit_value << "\n";

  RiskViolationEvent event;
  event.breach = breach;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  event.sequence_id = cycle_id;

  verdict.breaches.push_back(std::move(breach));
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// evaluate: the gate chain
// -----------------------------------------------------------------------------
domain::RiskVerdict RiskGovernor::evaluate(
    domain::PortfolioState& state, double total_equity,
    const std::unordered_map<std::string, double>& positions_usd,
    std::uint64_t cycle_id) {
  using domain::RiskBreach;
  using domain::RiskRule;

  domain::RiskVerdict verdict;

  // --- Gate 0: operator kill switch ----------------------------------------
  if (halted_.load()) {
    recordBreach(verdict, RiskBreach{RiskRule::OperatorHalt, "", 1.0, 0.0},
                 cycle_id);
  }

  // --- Peak tracking (unconditional) ---------------------------------------
  calibratePeak(state, total_equity);
  state.peak_equity = std::max(state.peak_equity, total_equity);
  verdict.peak_equity = state.peak_equity;

  // --- Gate 1: ratios need positive denominators ---------------------------
  const bool equity_valid = total_equity > 0.0;
  const bool peak_valid = state.peak_equity > 0.0;
  if (!equity_valid || !peak_valid) {
    recordBreach(verdict,
                 RiskBreach{RiskRule::InvalidEquity, "", total_equity, 0.0},
                 cycle_id);
  }

  // --- Gate 2: maximum drawdown --------------------------------------------
  if (peak_valid) {
    verdict.drawdown_fraction =
        (state.peak_equity - total_equity) / state.peak_equity;
    if (verdict.drawdown_fraction > limits_.max_drawdown_fraction) {
      recordBreach(verdict,
                   RiskBreach{RiskRule::MaxDrawdown, "",
                              verdict.drawdown_fraction,
                              limits_.max_drawdown_fraction},
                   cycle_id);
    }
  }

  // --- Gate 3: single-asset exposure, every symbol -------------------------
  // Iterate in symbol order so the breach list is deterministic.
  if (equity_valid) {
    std::map<std::string, double> ordered(positions_usd.begin(),
                                          positions_usd.end());
    for (const auto& [symbol, value] : ordered) {
      const double fraction = value / total_equity;
      if (fraction > limits_.max_single_asset_fraction) {
        recordBreach(verdict,
                     RiskBreach{RiskRule::SingleAssetExposure, symbol, fraction,
                                limits_.max_single_asset_fraction},
                     cycle_id);
      }
    }
  }

  // --- Gate 4: daily loss circuit breaker ----------------------------------
  const double loss_floor =
      -limits_.max_daily_loss_fraction * state.initial_cash;
  if (state.daily_pnl < loss_floor) {
    recordBreach(verdict,
                 RiskBreach{RiskRule::DailyLoss, "", state.daily_pnl, loss_floor},
                 cycle_id);
  }

  return verdict;
}

}  // namespace rebal

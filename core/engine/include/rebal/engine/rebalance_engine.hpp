#pragma once

#include "rebal/config/engine_config.hpp"
#include "rebal/domain/account_snapshot.hpp"
#include "rebal/domain/fault.hpp"
#include "rebal/domain/order.hpp"
#include "rebal/domain/portfolio_state.hpp"
#include "rebal/domain/risk_verdict.hpp"
#include "rebal/eventbus/event_bus.hpp"
#include "rebal/execution/i_account_query.hpp"
#include "rebal/execution/i_order_submission.hpp"
#include "rebal/market/i_price_feed.hpp"
#include "rebal/normalize/order_normalizer.hpp"
#include "rebal/risk/risk_governor.hpp"
#include "rebal/rules/i_rule_registry.hpp"
#include "rebal/signal/signal_calculator.hpp"
#include "rebal/sizing/position_sizer.hpp"
#include "rebal/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rebal {

// Everything the engine decided for one cycle, before any submission.
struct CycleDecision {
  std::uint64_t cycle_id{0};
  domain::RiskVerdict verdict;
  std::map<std::string, double> momentum;
  std::vector<domain::TradeIntent> intents;
  std::vector<domain::NormalizedOrder> approved_orders;
  std::size_t suppressed{0};        // Dropped by the normalizer (noise / zero)
  std::size_t withheld_by_risk{0};  // Would have been approved; verdict failed
  std::vector<domain::SymbolFault> faults;
  double total_equity_usd{0.0};
  double available_cash_usd{0.0};
};

struct SubmissionResult {
  domain::NormalizedOrder order;
  bool accepted{false};
  std::string error;
};

struct CycleReport {
  CycleDecision decision;
  std::vector<SubmissionResult> submissions;
  bool aborted{false};
  std::string abort_reason;

  std::size_t rejectedCount() const;
};

// -----------------------------------------------------------------------------
// RebalanceEngine
// -----------------------------------------------------------------------------
//
// @brief  Drives one synchronous rebalancing cycle:
//         account snapshot → signals → risk verdict → sizing → normalization
//         → independent order submission.
//
// @details
// The engine owns the four decision components and the EventBus they publish
// on. External collaborators (price feed, account, order sink, rule
// registry, clock) are injected by reference and must outlive the engine.
//
// Cycle rules:
//   - A symbol that faulted in the signal stage is not traded this cycle.
//   - The risk verdict is computed once per cycle, before any order is
//     released. If it fails, no order is submitted; the orders that would
//     have been released are counted in CycleDecision::withheld_by_risk.
//   - Each approved order is submitted on its own. An ExecutionError is
//     recorded against that order only; its siblings still go out.
//   - If the account snapshot cannot be taken the cycle is aborted with no
//     state change.
//   - When the clock crosses a UTC day boundary between cycles, the daily
//     P&L baseline is moved to the current equity before evaluation.
//
// Events published on eventBus():
//   SymbolFaultEvent, RiskViolationEvent (from the governor), OrderEvent,
//   ExecutionReportEvent, CycleSummaryEvent. Subscribers run synchronously
//   on the cycle thread.
//
// Thread model:
//   Every public method serializes on one mutex, so commands arriving on the
//   IPC thread never interleave with a running cycle. PortfolioState has
//   exactly one writer at a time.
// -----------------------------------------------------------------------------
class RebalanceEngine {
 public:
  RebalanceEngine(EngineConfig config, const IPriceFeed& feed,
                  const IAccountQuery& account, IOrderSubmission& orders,
                  const IRuleRegistry& rules, const ITimeProvider& clock,
                  domain::PortfolioState initial_state);

  RebalanceEngine(const RebalanceEngine&) = delete;
  RebalanceEngine& operator=(const RebalanceEngine&) = delete;

  // Runs one full cycle. Never throws for collaborator failures.
  CycleReport runCycle();

  // -------------------------------------------------------------------------
  // decide(batch, snapshot, cycle_id)
  // -------------------------------------------------------------------------
  //
  // @brief  The decision half of a cycle, with no submission and no events
  //         other than the governor's RiskViolationEvents.
  //
  // @details
  // Works on a copy of the portfolio state: daily P&L is recomputed from
  // `snapshot` and the governor evaluates the copy, so the engine's peak and
  // P&L are left untouched. Then sizes and normalizes every tradable symbol
  // in configured order. Exposed so callers can dry-run a cycle against a
  // hand-built snapshot.
  // -------------------------------------------------------------------------
  CycleDecision decide(const SignalBatch& batch,
                       const domain::AccountSnapshot& snapshot,
                       std::uint64_t cycle_id = 0);

  // Moves the daily P&L baseline to the account's current equity. Throws
  // std::runtime_error if that equity is not finite and positive.
  void startNewTradingDay();

  // Re-anchors the drawdown peak to the account's current equity. Same
  // equity check as startNewTradingDay().
  void resetPeak();

  // Operator JSON command surface (PING, STATUS, HALT, RESUME, RESET_DAY,
  // RESET_PEAK, RUN_CYCLE).
  std::string executeCommand(const std::string& cmd);

  domain::PortfolioState portfolioState() const;
  std::uint64_t cycleCount() const;

  EventBus& eventBus() { return bus_; }
  const EngineConfig& config() const { return config_; }

 private:
  domain::AccountSnapshot captureSnapshot() const;

  CycleDecision decideLocked(domain::PortfolioState& state,
                             const SignalBatch& batch,
                             const domain::AccountSnapshot& snapshot,
                             std::uint64_t cycle_id);

  void rollTradingDay(double total_equity);

  void submitApproved(CycleReport& report);

  void publishSummary(const CycleReport& report);

  nlohmann::json statusLocked() const;

  static nlohmann::json summarize(const CycleReport& report);

  const EngineConfig config_;
  const IPriceFeed& feed_;
  const IAccountQuery& account_;
  IOrderSubmission& orders_;
  const IRuleRegistry& rules_;
  const ITimeProvider& clock_;

  EventBus bus_;
  SignalCalculator signals_;
  PositionSizer sizer_;
  OrderNormalizer normalizer_;
  RiskGovernor governor_;

  mutable std::mutex mutex_;
  domain::PortfolioState state_;
  std::uint64_t cycle_count_{0};
  std::optional<std::int64_t> trading_day_;
  std::optional<nlohmann::json> last_summary_;
};

}  // namespace rebal

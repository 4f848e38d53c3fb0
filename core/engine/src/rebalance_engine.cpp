#include "rebal/engine/rebalance_engine.hpp"
#include "rebal/domain/errors.hpp"
#include "rebal/domain/market_data.hpp"
#include "rebal/events/event.hpp"
#include "rebal/events/event_json.hpp"
#include "rebal/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace rebal {

std::size_t CycleReport::rejectedCount() const {
  return static_cast<std::size_t>(
      std::count_if(submissions.begin(), submissions.end(),
                    [](const SubmissionResult& s) { return !s.accepted; }));
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
RebalanceEngine::RebalanceEngine(EngineConfig config, const IPriceFeed& feed,
                                 const IAccountQuery& account,
                                 IOrderSubmission& orders,
                                 const IRuleRegistry& rules,
                                 const ITimeProvider& clock,
                                 domain::PortfolioState initial_state)
    : config_(std::move(config)),
      feed_(feed),
      account_(account),
      orders_(orders),
      rules_(rules),
      clock_(clock),
      signals_(feed_, rules_),
      sizer_(config_.sizing),
      normalizer_(config_.normalizer),
      governor_(bus_, config_.risk, clock_),
      state_(initial_state) {}

// -----------------------------------------------------------------------------
// captureSnapshot(): one read of every account figure per cycle
// -----------------------------------------------------------------------------
domain::AccountSnapshot RebalanceEngine::captureSnapshot() const {
  domain::AccountSnapshot snapshot;
  snapshot.balances = account_.getBalances();
  snapshot.positions_usd = account_.getPositionsUsd();
  snapshot.total_equity_usd = account_.getTotalEquityUsd();
  snapshot.available_cash_usd = account_.getAvailableCashUsd();
  return snapshot;
}

namespace {

bool isUsableEquity(double equity) {
  return std::isfinite(equity) && equity > 0.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// rollTradingDay(): caller holds mutex_
// -----------------------------------------------------------------------------
void RebalanceEngine::rollTradingDay(double total_equity) {
  const std::int64_t today = utc_day_index(clock_.now_ms());
  if (!trading_day_.has_value()) {
    trading_day_ = today;
    return;
  }
  if (today != *trading_day_) {
    // A NaN baseline would switch the daily-loss gate off for a whole day.
    if (!isUsableEquity(total_equity)) {
      std::cerr << "[RebalanceEngine] Day roll deferred, equity "
                << total_equity << " is not usable as a baseline\n";
      return;
    }
    trading_day_ = today;
    state_.startNewDay(total_equity);
    std::cout << "[RebalanceEngine] New UTC trading day " << today
              << ", baseline equity " << total_equity << "\n";
  }
}

// -----------------------------------------------------------------------------
// runCycle()
// -----------------------------------------------------------------------------
CycleReport RebalanceEngine::runCycle() {
  std::lock_guard lock(mutex_);
  const std::uint64_t cycle_id = ++cycle_count_;

  CycleReport report;
  report.decision.cycle_id = cycle_id;

  domain::AccountSnapshot snapshot;
  try {
    snapshot = captureSnapshot();
  } catch (const std::exception& e) {
    report.aborted = true;
    report.abort_reason = std::string("account query failed: ") + e.what();
    std::cerr << "[RebalanceEngine] Cycle " << cycle_id
              << " aborted: " << report.abort_reason << "\n";
    publishSummary(report);
    return report;
  }

  rollTradingDay(snapshot.total_equity_usd);
  state_.observeEquity(snapshot.total_equity_usd);

  const SignalBatch batch = signals_.compute(config_.harness.symbols);
  report.decision = decideLocked(state_, batch, snapshot, cycle_id);

  const Timestamp now = ms_to_timestamp(clock_.now_ms());
  for (const auto& fault : report.decision.faults) {
    bus_.publish(SymbolFaultEvent{fault, now, cycle_id});
  }

  if (!report.decision.verdict.passed) {
    std::cerr << "[RebalanceEngine] Cycle " << cycle_id << " blocked by "
              << domain::toString(report.decision.verdict.breached) << ", "
              << report.decision.withheld_by_risk
              << " order(s) withheld.\n";
  }

  submitApproved(report);

  std::cout << "[RebalanceEngine] Cycle " << cycle_id
            << " equity=" << snapshot.total_equity_usd
            << " peak=" << state_.peak_equity
            << " daily_pnl=" << state_.daily_pnl
            << " approved=" << report.decision.approved_orders.size()
            << " rejected=" << report.rejectedCount()
            << " faults=" << report.decision.faults.size() << "\n";

  publishSummary(report);
  last_summary_ = summarize(report);
  return report;
}

// -----------------------------------------------------------------------------
// decide()
// -----------------------------------------------------------------------------
CycleDecision RebalanceEngine::decide(const SignalBatch& batch,
                                      const domain::AccountSnapshot& snapshot,
                                      std::uint64_t cycle_id) {
  std::lock_guard lock(mutex_);
  domain::PortfolioState scratch = state_;
  scratch.observeEquity(snapshot.total_equity_usd);
  return decideLocked(scratch, batch, snapshot, cycle_id);
}

CycleDecision RebalanceEngine::decideLocked(
    domain::PortfolioState& state, const SignalBatch& batch,
    const domain::AccountSnapshot& snapshot, std::uint64_t cycle_id) {
  CycleDecision decision;
  decision.cycle_id = cycle_id;
  decision.momentum = batch.momentum;
  decision.faults = batch.faults;
  decision.total_equity_usd = snapshot.total_equity_usd;
  decision.available_cash_usd = snapshot.available_cash_usd;

  decision.verdict = governor_.evaluate(state, snapshot.total_equity_usd,
                                        snapshot.positions_usd, cycle_id);

  std::optional<double> max_position;
  if (config_.sizing.clip_to_exposure_limit) {
    max_position = governor_.maxPositionUsd(snapshot.total_equity_usd);
  }

  std::vector<domain::NormalizedOrder> candidates;

  for (const auto& symbol : config_.harness.symbols) {
    if (!batch.isTradable(symbol)) {
      continue;
    }

    SizingInput input;
    input.symbol = symbol;
    input.return_fraction = batch.momentum.at(symbol);
    input.current_usd = snapshot.positionUsd(symbol);
    input.available_cash_usd = snapshot.available_cash_usd;
    input.price = batch.latest_price.at(symbol);
    input.held_quantity = snapshot.balanceOf(domain::baseAsset(symbol));
    input.max_position_usd = max_position;

    auto sized = sizer_.size(input);
    if (const auto* fault = std::get_if<domain::SymbolFault>(&sized)) {
      decision.faults.push_back(*fault);
      continue;
    }
    const auto& intent = std::get<domain::TradeIntent>(sized);
    decision.intents.push_back(intent);

    if (intent.isNoOp()) {
      ++decision.suppressed;
      continue;
    }

    try {
      const domain::AssetRule rule = rules_.getRule(symbol);
      auto order = normalizer_.normalize(intent, rule);
      if (!order.has_value()) {
        ++decision.suppressed;
        continue;
      }
      candidates.push_back(std::move(*order));
    } catch (const UnknownSymbolError& e) {
      decision.faults.push_back(
          {symbol, domain::FaultKind::UnknownSymbol, e.what()});
    }
  }

  if (decision.verdict.passed) {
    decision.approved_orders = std::move(candidates);
  } else {
    decision.withheld_by_risk = candidates.size();
  }
  return decision;
}

// -----------------------------------------------------------------------------
// submitApproved(): each order independently, caller holds mutex_
// -----------------------------------------------------------------------------
void RebalanceEngine::submitApproved(CycleReport& report) {
  const std::uint64_t cycle_id = report.decision.cycle_id;

  for (const auto& order : report.decision.approved_orders) {
    const Timestamp now = ms_to_timestamp(clock_.now_ms());
    bus_.publish(OrderEvent{order, now, cycle_id});

    SubmissionResult result;
    result.order = order;
    try {
      orders_.submit(order);
      result.accepted = true;
    } catch (const ExecutionError& e) {
      result.error = e.what();
      std::cerr << "[RebalanceEngine] " << domain::toString(order.side) << " "
                << order.quantity << " " << order.symbol
                << " rejected: " << result.error << "\n";
      report.decision.faults.push_back(
          {order.symbol, domain::FaultKind::ExecutionError, result.error});
    }

    ExecutionReportEvent exec;
    exec.order = order;
    exec.status = result.accepted ? ExecutionStatus::Submitted
                                  : ExecutionStatus::Rejected;
    exec.message = result.error;
    exec.timestamp = ms_to_timestamp(clock_.now_ms());
    exec.sequence_id = cycle_id;
    bus_.publish(exec);

    report.submissions.push_back(std::move(result));
  }
}

// -----------------------------------------------------------------------------
// publishSummary()
// -----------------------------------------------------------------------------
void RebalanceEngine::publishSummary(const CycleReport& report) {
  CycleSummaryEvent summary;
  summary.passed = report.decision.verdict.passed && !report.aborted;
  summary.aborted = report.aborted;
  summary.breached_rule = domain::toString(report.decision.verdict.breached);
  summary.approved_orders = report.decision.approved_orders.size();
  summary.rejected_orders = report.rejectedCount();
  summary.faults = report.decision.faults.size();
  summary.total_equity_usd = report.decision.total_equity_usd;
  summary.peak_equity_usd = state_.peak_equity;
  summary.daily_pnl_usd = state_.daily_pnl;
  summary.timestamp = ms_to_timestamp(clock_.now_ms());
  summary.sequence_id = report.decision.cycle_id;
  bus_.publish(summary);
}

nlohmann::json RebalanceEngine::summarize(const CycleReport& report) {
  nlohmann::json j;
  j["cycle"] = report.decision.cycle_id;
  j["aborted"] = report.aborted;
  if (report.aborted) {
    j["abort_reason"] = report.abort_reason;
  }
  j["passed"] = report.decision.verdict.passed;
  j["breached_rule"] = domain::toString(report.decision.verdict.breached);
  j["total_equity_usd"] = report.decision.total_equity_usd;
  j["momentum"] = report.decision.momentum;
  j["withheld_by_risk"] = report.decision.withheld_by_risk;
  j["suppressed"] = report.decision.suppressed;

  nlohmann::json orders = nlohmann::json::array();
  for (const auto& s : report.submissions) {
    nlohmann::json o = toJson(s.order);
    o["accepted"] = s.accepted;
    if (!s.accepted) {
      o["error"] = s.error;
    }
    orders.push_back(std::move(o));
  }
  j["orders"] = std::move(orders);

  nlohmann::json faults = nlohmann::json::array();
  for (const auto& f : report.decision.faults) {
    faults.push_back(nlohmann::json{{"symbol", f.symbol},
                                    {"kind", domain::toString(f.kind)},
                                    {"detail", f.detail}});
  }
  j["faults"] = std::move(faults);
  return j;
}

// -----------------------------------------------------------------------------
// Lifecycle triggers
// -----------------------------------------------------------------------------
void RebalanceEngine::startNewTradingDay() {
  std::lock_guard lock(mutex_);
  const double equity = account_.getTotalEquityUsd();
  if (!isUsableEquity(equity)) {
    throw std::runtime_error("cannot start a trading day at equity " +
                             std::to_string(equity));
  }
  state_.startNewDay(equity);
  trading_day_ = utc_day_index(clock_.now_ms());
  std::cout << "[RebalanceEngine] Daily baseline reset to " << equity << "\n";
}

void RebalanceEngine::resetPeak() {
  std::lock_guard lock(mutex_);
  const double equity = account_.getTotalEquityUsd();
  if (!isUsableEquity(equity)) {
    throw std::runtime_error("cannot reset peak to equity " +
                             std::to_string(equity));
  }
  state_.resetPeak(equity);
  std::cout << "[RebalanceEngine] Peak equity reset to " << equity << "\n";
}

domain::PortfolioState RebalanceEngine::portfolioState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::uint64_t RebalanceEngine::cycleCount() const {
  std::lock_guard lock(mutex_);
  return cycle_count_;
}

// -----------------------------------------------------------------------------
// statusLocked(): caller holds mutex_
// -----------------------------------------------------------------------------
nlohmann::json RebalanceEngine::statusLocked() const {
  nlohmann::json j;
  j["status"] = "ok";
  j["halted"] = governor_.isHalted();
  j["cycles"] = cycle_count_;
  j["peak_equity_usd"] = state_.peak_equity;
  j["daily_pnl_usd"] = state_.daily_pnl;
  j["day_start_equity_usd"] = state_.day_start_equity;
  j["initial_cash_usd"] = state_.initial_cash;
  j["symbols"] = config_.harness.symbols;
  j["last_cycle"] =
      last_summary_.has_value() ? *last_summary_ : nlohmann::json(nullptr);
  return j;
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands from the IPC thread
// -----------------------------------------------------------------------------
std::string RebalanceEngine::executeCommand(const std::string& raw) {
  std::string cmd = raw;
  cmd.erase(std::remove_if(cmd.begin(), cmd.end(),
                           [](unsigned char c) { return std::isspace(c); }),
            cmd.end());
  std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  nlohmann::json response;

  try {
    if (cmd == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (cmd == "STATUS") {
      std::lock_guard lock(mutex_);
      response = statusLocked();
    } else if (cmd == "HALT") {
      governor_.haltTrading();
      response["status"] = "ok";
      response["response"] = "Trading halted";
    } else if (cmd == "RESUME") {
      governor_.resumeTrading();
      response["status"] = "ok";
      response["response"] = "Trading resumed";
    } else if (cmd == "RESET_DAY") {
      startNewTradingDay();
      response["status"] = "ok";
      response["response"] = "Daily P&L baseline reset";
    } else if (cmd == "RESET_PEAK") {
      resetPeak();
      response["status"] = "ok";
      response["response"] = "Peak equity reset";
    } else if (cmd == "RUN_CYCLE") {
      CycleReport report = runCycle();
      response["status"] = report.aborted ? "error" : "ok";
      response["cycle"] = summarize(report);
    } else {
      // Operator input is arbitrary bytes; it is never copied into the reply.
      response["status"] = "error";
      response["response"] = "Unknown command";
    }
  } catch (const std::exception& e) {
    std::cerr << "[RebalanceEngine] Command " << cmd
              << " failed: " << e.what() << "\n";
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] = e.what();
  }

  // Exception text may carry collaborator bytes that are not valid UTF-8.
  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

}  // namespace rebal

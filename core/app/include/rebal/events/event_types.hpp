#pragma once

#include "rebal/domain/fault.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time attached to every event. Produced from
// ITimeProvider::now_ms() through ms_to_timestamp().
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// SymbolFaultEvent
// -----------------------------------------------------------------------------
// A symbol was skipped this cycle (no data, no rule, bad price, or a
// rejected submission). Published by the RebalanceEngine for telemetry; the
// same fault is also in the CycleReport.
// -----------------------------------------------------------------------------
struct SymbolFaultEvent {
  domain::SymbolFault fault;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};  // Cycle id
};

// -----------------------------------------------------------------------------
// CycleSummaryEvent
// -----------------------------------------------------------------------------
// Last event of every cycle. breached_rule is "None" on a passing cycle.
// -----------------------------------------------------------------------------
struct CycleSummaryEvent {
  bool passed{true};
  bool aborted{false};
  std::string breached_rule;
  std::size_t approved_orders{0};
  std::size_t rejected_orders{0};
  std::size_t faults{0};
  double total_equity_usd{0.0};
  double peak_equity_usd{0.0};
  double daily_pnl_usd{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace rebal

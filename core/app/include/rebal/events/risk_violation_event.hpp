#pragma once

#include "rebal/domain/risk_verdict.hpp"
#include "rebal/events/event_types.hpp"

#include <cstdint>

namespace rebal {

// -----------------------------------------------------------------------------
// RiskViolationEvent: one failed circuit-breaker gate
// -----------------------------------------------------------------------------
//
// @brief  Published by the RiskGovernor once per breach, in evaluation order.
//
// @details
// A cycle in which several gates fail produces several events. The first one
// carries the rule reported as RiskVerdict::breached. The breach values are
// fractions for the ratio gates and USD for the daily loss gate:
//
//   MaxDrawdown          current = drawdown fraction,  limit = max fraction
//   SingleAssetExposure  current = value / equity,     limit = max fraction
//   DailyLoss            current = daily P&L (USD),    limit = -loss floor
//
// Thread model:
//   Created on the cycle thread. Value type, so it can be queued to the IPC
//   thread as part of the Event variant.
// -----------------------------------------------------------------------------
struct RiskViolationEvent {
  domain::RiskBreach breach;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};  // Cycle id
};

}  // namespace rebal

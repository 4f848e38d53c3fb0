#pragma once

#include "rebal/domain/order.hpp"
#include "rebal/events/event_types.hpp"

namespace rebal {

// -----------------------------------------------------------------------------
// OrderEvent
// -----------------------------------------------------------------------------
// An order approved by the RiskGovernor, published just before it is handed
// to IOrderSubmission. Orders withheld by a failing verdict never produce an
// OrderEvent.
// -----------------------------------------------------------------------------
struct OrderEvent {
  domain::NormalizedOrder order;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};  // Cycle id
};

}  // namespace rebal

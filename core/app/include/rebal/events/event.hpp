#pragma once

#include "rebal/events/event_types.hpp"
#include "rebal/events/execution_report_event.hpp"
#include "rebal/events/order_event.hpp"
#include "rebal/events/risk_violation_event.hpp"

#include <variant>

namespace rebal {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The envelope carried by the EventBus and by the IPC telemetry queue. Adding
// an alternative means updating the JSON formatter in event_json.cpp; the
// std::visit there fails to compile until it is handled.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SymbolFaultEvent,
    RiskViolationEvent,
    OrderEvent,
    ExecutionReportEvent,
    CycleSummaryEvent>;

}  // namespace rebal

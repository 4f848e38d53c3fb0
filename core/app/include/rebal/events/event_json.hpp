#pragma once

#include "rebal/events/event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// Telemetry formatting
// -----------------------------------------------------------------------------
//
// @brief  Converts engine events into the JSON objects broadcast on the IPC
//         PUB socket.
//
// @details
// Every object carries a "type" discriminator ("symbol_fault",
// "risk_violation", "order", "execution_report", "cycle_summary") and the
// cycle id as "cycle". Timestamps are epoch milliseconds.
//
// Pure functions, safe to call from any thread.
// -----------------------------------------------------------------------------
nlohmann::json toJson(const Event& event);

std::string formatTelemetry(const Event& event);

nlohmann::json toJson(const domain::NormalizedOrder& order);

}  // namespace rebal

#pragma once

#include "rebal/domain/order.hpp"
#include "rebal/events/event_types.hpp"

#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// ExecutionStatus
// -----------------------------------------------------------------------------
//   Submitted: the collaborator accepted the order without throwing.
//   Rejected: the collaborator threw ExecutionError; message holds why.
// -----------------------------------------------------------------------------
enum class ExecutionStatus {
  Submitted,
  Rejected,
};

inline const char* toString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::Submitted: return "Submitted";
    case ExecutionStatus::Rejected:  return "Rejected";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// ExecutionReportEvent
// -----------------------------------------------------------------------------
//
// @brief  Outcome of one IOrderSubmission::submit() call.
//
// @details
// One report per approved order. A rejection only affects its own order;
// siblings from the same cycle get their own reports.
// -----------------------------------------------------------------------------
struct ExecutionReportEvent {
  domain::NormalizedOrder order;
  ExecutionStatus status{ExecutionStatus::Submitted};
  std::string message;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};  // Cycle id
};

}  // namespace rebal

#pragma once

#include "rebal/domain/order.hpp"

namespace rebal {

// -----------------------------------------------------------------------------
// IOrderSubmission: hands an approved order to the venue
// -----------------------------------------------------------------------------
//
// @brief  One call per approved order. The engine submits orders of a cycle
//         independently: if one throws, the others are still submitted.
//
// @details
// Retry and backoff belong to the implementation, not to the engine. A
// rejection is reported by throwing ExecutionError; the engine logs it and
// records it in the cycle report.
// -----------------------------------------------------------------------------
class IOrderSubmission {
 public:
  virtual ~IOrderSubmission() = default;

  // @throws ExecutionError when the venue rejects the order.
  virtual void submit(const domain::NormalizedOrder& order) = 0;
};

}  // namespace rebal

#pragma once

#include <cstdint>

namespace rebal {

// -----------------------------------------------------------------------------
// ITimeProvider: injectable clock
// -----------------------------------------------------------------------------
//
// @brief  The engine asks this interface for "now" instead of reading the
//         system clock, so tests and replays control time.
//
// @details
//   LiveTimeProvider        wall clock, used by the paper harness.
//   SimulationTimeProvider  value set by the caller, used by tests and by
//                           tick replay.
//
// Time is only used to stamp events and to let the harness notice a UTC date
// change. No decision in the engine depends on it.
//
// Implementations must be safe for concurrent reads.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace rebal

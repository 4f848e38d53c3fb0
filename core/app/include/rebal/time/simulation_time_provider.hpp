#pragma once

#include "rebal/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace rebal {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: clock that only moves when told to
// -----------------------------------------------------------------------------
//
// @brief  Returns whatever advance_time() last stored (0 before the first
//         call).
//
// @details
// Used by unit tests to produce deterministic event timestamps and to drive
// the day-rollover logic of the harness without sleeping. The stored value is
// an std::atomic so a replay thread can advance it while the cycle thread
// reads it.
//
// advance_time() does not enforce monotonicity; feeding time in order is the
// caller's responsibility.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace rebal

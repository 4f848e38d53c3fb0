#pragma once

#include "rebal/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace rebal {

// -----------------------------------------------------------------------------
// Time conversion helpers
// -----------------------------------------------------------------------------
// ITimeProvider speaks epoch milliseconds; events carry a Timestamp. These
// two inline functions are the only place the conversion happens.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// utc_day_index
// -----------------------------------------------------------------------------
// Number of whole UTC days since the epoch. Two timestamps belong to the same
// trading day iff their indices are equal. Negative inputs floor toward
// minus infinity so that -1 ms is day -1, not day 0.
// -----------------------------------------------------------------------------
inline std::int64_t utc_day_index(std::int64_t epoch_ms) {
  constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;
  std::int64_t day = epoch_ms / kMsPerDay;
  if (epoch_ms % kMsPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace rebal

#pragma once

#include "rebal/time/i_time_provider.hpp"

namespace rebal {

// -----------------------------------------------------------------------------
// LiveTimeProvider: ITimeProvider backed by std::chrono::system_clock
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace rebal

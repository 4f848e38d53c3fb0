#pragma once

#include "rebal/domain/market_data.hpp"

#include <optional>
#include <string>

namespace rebal {

// A decoded price tick as published by the upstream feeder.
struct PriceTick {
  std::string symbol;
  domain::PricePoint point;
};

// -----------------------------------------------------------------------------
// parseTick(payload)
// -----------------------------------------------------------------------------
//
// @brief  Decodes one JSON tick message:
//           {"timestamp_ms": 1700000000000, "symbol": "BTC/USD", "price": 1.0}
//
// @return The tick, or std::nullopt when the payload is not valid JSON, a
//         required key is missing, or a field has the wrong type. The reason
//         is written to stderr; the caller simply skips the message.
// -----------------------------------------------------------------------------
std::optional<PriceTick> parseTick(const std::string& payload);

}  // namespace rebal

#include "rebal/market/tick_parser.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace rebal {

// -----------------------------------------------------------------------------
// parseTick
// -----------------------------------------------------------------------------
std::optional<PriceTick> parseTick(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    // at() throws out_of_range for a missing key, get<>() throws type_error
    // for a mismatched one; both land in the catch below.
    PriceTick tick;
    tick.point.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    tick.symbol = json.at("symbol").get<std::string>();
    tick.point.price = json.at("price").get<double>();
    return tick;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] Malformed tick skipped: " << e.what()
              << " payload=" << payload << "\n";
    return std::nullopt;
  }
}

}  // namespace rebal

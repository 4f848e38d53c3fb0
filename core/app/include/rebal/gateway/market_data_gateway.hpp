#pragma once

#include "rebal/market/tick_parser.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace rebal {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB receiver for price ticks
// -----------------------------------------------------------------------------
//
// @brief  Connects to an upstream price publisher, decodes each JSON tick
//         with parseTick() and hands it to a sink callback.
//
// @details
// The sink is typically bound to PriceHistoryStore::record(), which is the
// engine's IPriceFeed. Malformed messages are skipped; the loop never exits
// because of a bad payload.
//
// Thread model:
//   run() blocks and is meant for a dedicated thread. stop() may be called
//   from any thread (including a signal handler); the loop notices within
//   kRecvTimeoutMs.
//
// Ownership:
//   Owns the ZMQ context and socket. Holds a copy of the sink.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using TickSink = std::function<void(const PriceTick&)>;

  explicit MarketDataGateway(
      TickSink sink, const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;

  void run();

  void stop();

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t rejected() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  TickSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace rebal

#include "rebal/gateway/market_data_gateway.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace rebal {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(TickSink sink,
                                     const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout the stop flag would never be re-checked.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
  std::cout << "[MarketDataGateway] Connected to " << endpoint << "\n";
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    ++received_;
    std::string payload(static_cast<const char*>(msg.data()), msg.size());
    auto tick = parseTick(payload);
    if (!tick.has_value()) {
      ++rejected_;
      continue;
    }
    sink_(*tick);
  }

  std::cout << "[MarketDataGateway] Stopped after " << received_.load()
            << " message(s), " << rejected_.load() << " rejected.\n";
}

// -----------------------------------------------------------------------------
// stop(): signal the recv loop to exit
// -----------------------------------------------------------------------------
void MarketDataGateway::stop() { running_.store(false); }

}  // namespace rebal

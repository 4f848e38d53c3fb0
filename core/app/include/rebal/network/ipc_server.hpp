#pragma once

#include "rebal/concurrent/thread_safe_queue.hpp"
#include "rebal/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace rebal {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ operator surface for the rebalancer
// -----------------------------------------------------------------------------
//
// @brief  Runs one worker thread that serves operator commands on a REP
//         socket and broadcasts engine telemetry on a PUB socket.
//
// @details
//   REP (commands): each request is a command string such as "STATUS" or
//   "HALT". It is handed to the command handler (bound to
//   RebalanceEngine::executeCommand()) and the JSON reply is sent back.
//
//   PUB (telemetry): events pushed with pushTelemetry() are formatted with
//   formatTelemetry() and published one JSON document per message. The
//   queue is bounded; if no one drains it the oldest events are dropped.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread,
//   usually an EventBus subscriber on the cycle thread. The command handler
//   runs on the IPC thread and must be thread-safe.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

 private:
  static constexpr int kPollTimeoutMs = 50;
  static constexpr std::size_t kTelemetryCapacity = 4096;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_{kTelemetryCapacity};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace rebal

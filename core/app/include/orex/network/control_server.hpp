#pragma once

#include "orex/concurrent/thread_safe_queue.hpp"
#include "orex/logging/logger.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace orex {

// -----------------------------------------------------------------------------
// ControlServer — ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers control commands on a REP socket and
//         broadcasts lifecycle telemetry on a PUB socket.
//
// @details
//   1. PUB socket: each queued telemetry object is published as one JSON
//      message. Producers (lifecycle callbacks on arbitrary threads) only
//      push into a ThreadSafeQueue, so serialization and socket I/O never
//      run on their stack.
//
//   2. REP socket: each request string is handed to the command handler
//      (bound to ExecutionEngine::executeCommand) and the returned JSON is
//      sent back. ZMQ_RCVTIMEO keeps the loop alternating between commands
//      and telemetry.
//
// A handler that throws std::exception yields
// {"status": "error", "error": what()} so the REQ peer is never left
// waiting.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//
// Ownership:
//   Owned by ExecutionEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class ControlServer {
 public:
  static constexpr const char* kComponent = "ControlServer";

  using CommandHandler = std::function<nlohmann::json(const std::string&)>;

  ControlServer(CommandHandler command_handler, std::string cmd_endpoint,
                std::string pub_endpoint, ILogger& logger);

  // RAII: stop().
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;
  ControlServer(ControlServer&&) = delete;
  ControlServer& operator=(ControlServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. Idempotent.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, then closes the sockets. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(nlohmann::json message);

  std::uint64_t commandsServed() const { return commands_served_.load(); }

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;
  ILogger& logger_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<nlohmann::json> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> commands_served_{0};
  std::thread thread_;
};

}  // namespace orex

#include "orex/network/control_server.hpp"

#include <cerrno>
#include <utility>

namespace orex {

ControlServer::ControlServer(CommandHandler command_handler,
                             std::string cmd_endpoint, std::string pub_endpoint,
                             ILogger& logger)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      logger_(logger) {}

ControlServer::~ControlServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void ControlServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  logger_.info(kComponent, "started",
               {{"command", cmd_endpoint_}, {"telemetry", pub_endpoint_}});
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void ControlServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  logger_.info(kComponent, "stopped",
               {{"commandsServed", commands_served_.load()}});
}

void ControlServer::pushTelemetry(nlohmann::json message) {
  telemetry_queue_.push(std::move(message));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void ControlServer::run() {
  try {
    while (running_.load()) {
      processTelemetry();
      processCommands();
    }
    // Publish whatever is still queued before the socket closes.
    processTelemetry();
  } catch (const zmq::error_t& e) {
    running_.store(false);
    logger_.error(kComponent, "socket failure, control plane stopped",
                  {{"reason", e.what()}, {"errno", e.num()}});
  }
}

void ControlServer::processTelemetry() {
  while (auto message = telemetry_queue_.try_pop()) {
    const std::string payload = message->dump();
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void ControlServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd(static_cast<const char*>(request.data()),
                        request.size());
  nlohmann::json response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    logger_.error(kComponent, "command handler threw",
                  {{"command", cmd}, {"reason", e.what()}});
    response = {{"status", "error"}, {"error", e.what()}};
  }

  const std::string payload = response.dump();
  zmq::message_t reply(payload.data(), payload.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
  commands_served_.fetch_add(1);
}

}  // namespace orex

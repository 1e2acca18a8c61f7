#include "orex/broker/zmq_bridge_connector.hpp"

#include "orex/domain/json_codec.hpp"
#include "orex/errors/execution_error.hpp"

#include <algorithm>
#include <utility>

namespace orex {

ZmqBridgeConnector::Options ZmqBridgeConnector::optionsFromJson(
    const nlohmann::json& params) {
  Options options;
  if (params.is_object()) {
    options.endpoint = params.value("endpoint", "");
    options.report_endpoint = params.value("report_endpoint", "");
    options.request_timeout = std::chrono::milliseconds(
        params.value("request_timeout_ms", std::int64_t{2000}));
    options.dealer = params.value("dealer", false);
  }
  if (options.endpoint.empty()) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "zmq_bridge requires params.endpoint",
                                     kComponent);
  }
  return options;
}

ZmqBridgeConnector::ZmqBridgeConnector(std::string client_id, Options options,
                                       ILogger& logger)
    : client_id_(std::move(client_id)),
      options_(std::move(options)),
      logger_(logger) {}

ZmqBridgeConnector::~ZmqBridgeConnector() {
  disconnect();
  std::lock_guard lock(request_mutex_);
  socket_.reset();
}

// -----------------------------------------------------------------------------
// connect(): ping the gateway and start the report stream
// -----------------------------------------------------------------------------
void ZmqBridgeConnector::connect(const CallContext& ctx) {
  if (connected_.load()) {
    return;
  }

  try {
    request("ping", nlohmann::json::object(), ctx);
  } catch (const ExecutionError& e) {
    if (isCancelled(e) || isValidationError(e)) {
      throw;
    }
    throw ExecutionError::network(ErrorCode::ConnectionFailed,
                                  "gateway " + options_.endpoint +
                                      " unreachable: " + e.message(),
                                  kComponent, std::current_exception());
  }

  connected_.store(true);

  if (!options_.report_endpoint.empty() && !reports_running_.load()) {
    reports_running_.store(true);
    report_thread_ = std::thread([this] { runReports(); });
  }

  logger_.info(kComponent, "connected",
               {{"clientId", client_id_},
                {"endpoint", options_.endpoint},
                {"reportEndpoint", options_.report_endpoint}});
}

void ZmqBridgeConnector::disconnect() {
  connected_.store(false);
  reports_running_.store(false);
  if (report_thread_.joinable()) {
    report_thread_.join();
  }
}

bool ZmqBridgeConnector::isConnected() const { return connected_.load(); }

// -----------------------------------------------------------------------------
// Socket management (caller holds request_mutex_)
// -----------------------------------------------------------------------------
void ZmqBridgeConnector::ensureSocketLocked() {
  if (socket_) {
    return;
  }
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(options_.endpoint);
}

void ZmqBridgeConnector::resetSocketLocked() { socket_.reset(); }

// -----------------------------------------------------------------------------
// request(): one REQ/REP round trip
// -----------------------------------------------------------------------------
nlohmann::json ZmqBridgeConnector::request(const std::string& op,
                                           nlohmann::json args,
                                           const CallContext& ctx) {
  ctx.throwIfDone(kComponent, op);

  nlohmann::json frame;
  frame["op"] = op;
  frame["client_id"] = client_id_;
  frame["request_id"] = request_ids_.next();
  frame["args"] = std::move(args);
  const std::string payload = frame.dump();

  std::lock_guard lock(request_mutex_);

  std::string raw;
  try {
    ensureSocketLocked();
    zmq::message_t out(payload.data(), payload.size());
    socket_->send(out, zmq::send_flags::none);

    const auto started = CallContext::Clock::now();
    for (;;) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          CallContext::Clock::now() - started);
      const auto budget =
          std::min(options_.request_timeout - elapsed, ctx.remaining());
      if (ctx.cancelled() || ctx.expired() || budget.count() <= 0) {
        resetSocketLocked();
        ctx.throwIfDone(kComponent, op);
        throw ExecutionError::network(
            ErrorCode::Timeout,
            op + " timed out after " +
                std::to_string(options_.request_timeout.count()) + "ms",
            kComponent);
      }

      zmq::pollitem_t items[] = {{socket_->handle(), 0, ZMQ_POLLIN, 0}};
      zmq::poll(items, 1, std::min(budget, kPollSlice));
      if ((items[0].revents & ZMQ_POLLIN) != 0) {
        zmq::message_t in;
        const auto received = socket_->recv(in, zmq::recv_flags::dontwait);
        if (received.has_value()) {
          raw.assign(static_cast<const char*>(in.data()), in.size());
          break;
        }
      }
    }
  } catch (const zmq::error_t& e) {
    resetSocketLocked();
    throw ExecutionError::network(ErrorCode::ConnectionFailed,
                                  op + " transport error: " + e.what(),
                                  kComponent, std::current_exception());
  }

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(raw);
  } catch (const nlohmann::json::exception& e) {
    throw ExecutionError::system(ErrorCode::InternalError,
                                 op + " reply is not valid JSON: " + e.what(),
                                 kComponent, std::current_exception());
  }

  if (!reply.is_object() || !reply.contains("ok") ||
      !reply.at("ok").is_boolean()) {
    throw ExecutionError::system(ErrorCode::InternalError,
                                 op + " reply is missing \"ok\"", kComponent);
  }
  if (!reply.at("ok").get<bool>()) {
    throwRemoteError(reply.value("error", nlohmann::json::object()), op);
  }
  return reply.value("result", nlohmann::json());
}

void ZmqBridgeConnector::throwRemoteError(const nlohmann::json& error,
                                          const std::string& op) const {
  std::string message = op + " failed";
  ErrorType type = ErrorType::Execution;
  ErrorCode code = ErrorCode::ExecutionFailed;

  if (error.is_object()) {
    message = error.value("message", message);
    const auto parsed_type = parseErrorType(error.value("type", ""));
    const auto parsed_code = parseErrorCode(error.value("code", ""));
    if (parsed_type && parsed_code) {
      type = *parsed_type;
      code = *parsed_code;
    }
  }

  switch (type) {
    case ErrorType::Validation:
      throw ExecutionError::validation(code, message, kComponent);
    case ErrorType::Network:
      throw ExecutionError::network(code, message, kComponent);
    case ErrorType::System:
      throw ExecutionError::system(code, message, kComponent);
    case ErrorType::Execution:
      break;
  }
  throw ExecutionError::execution(code, message, kComponent);
}

// -----------------------------------------------------------------------------
// Decoding helper: a malformed result is an internal error, not a crash
// -----------------------------------------------------------------------------
namespace {

template <typename T>
T decode(const nlohmann::json& result, const std::string& op) {
  try {
    return result.get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ExecutionError::system(ErrorCode::InternalError,
                                 op + " result malformed: " + e.what(),
                                 ZmqBridgeConnector::kComponent,
                                 std::current_exception());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------
domain::Session ZmqBridgeConnector::login(
    const domain::Credentials& credentials, const CallContext& ctx) {
  return decode<domain::Session>(
      request("login", nlohmann::json(credentials), ctx), "login");
}

void ZmqBridgeConnector::logout(const CallContext& ctx) {
  request("logout", nlohmann::json::object(), ctx);
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
domain::BrokerOrderResponse ZmqBridgeConnector::placeOrder(
    const domain::Order& order, const CallContext& ctx) {
  nlohmann::json args;
  args["order"] = order;
  return decode<domain::BrokerOrderResponse>(
      request("place_order", std::move(args), ctx), "place_order");
}

domain::BrokerOrderResponse ZmqBridgeConnector::cancelOrder(
    const std::string& broker_order_id, const CallContext& ctx) {
  nlohmann::json args;
  args["broker_order_id"] = broker_order_id;
  return decode<domain::BrokerOrderResponse>(
      request("cancel_order", std::move(args), ctx), "cancel_order");
}

domain::BrokerOrderResponse ZmqBridgeConnector::modifyOrder(
    const std::string& broker_order_id,
    const domain::OrderModification& modification, const CallContext& ctx) {
  nlohmann::json args;
  args["broker_order_id"] = broker_order_id;
  args["modification"] = modification;
  return decode<domain::BrokerOrderResponse>(
      request("modify_order", std::move(args), ctx), "modify_order");
}

domain::BrokerOrderDetails ZmqBridgeConnector::getOrderStatus(
    const std::string& broker_order_id, const CallContext& ctx) {
  nlohmann::json args;
  args["broker_order_id"] = broker_order_id;
  return decode<domain::BrokerOrderDetails>(
      request("order_status", std::move(args), ctx), "order_status");
}

domain::OrderBook ZmqBridgeConnector::getOrderBook(const CallContext& ctx) {
  return decode<domain::OrderBook>(
      request("order_book", nlohmann::json::object(), ctx), "order_book");
}

std::vector<domain::BrokerPosition> ZmqBridgeConnector::getPositions(
    const CallContext& ctx) {
  return decode<std::vector<domain::BrokerPosition>>(
      request("positions", nlohmann::json::object(), ctx), "positions");
}

std::vector<domain::Holding> ZmqBridgeConnector::getHoldings(
    const CallContext& ctx) {
  return decode<std::vector<domain::Holding>>(
      request("holdings", nlohmann::json::object(), ctx), "holdings");
}

domain::Quote ZmqBridgeConnector::getQuote(const std::string& symbol,
                                           const CallContext& ctx) {
  nlohmann::json args;
  args["symbol"] = symbol;
  return decode<domain::Quote>(request("quote", std::move(args), ctx),
                               "quote");
}

void ZmqBridgeConnector::subscribeQuotes(
    const std::vector<std::string>& symbols, const CallContext& ctx) {
  nlohmann::json args;
  args["symbols"] = symbols;
  request("subscribe", std::move(args), ctx);
}

void ZmqBridgeConnector::unsubscribeQuotes(
    const std::vector<std::string>& symbols, const CallContext& ctx) {
  nlohmann::json args;
  args["symbols"] = symbols;
  request("unsubscribe", std::move(args), ctx);
}

// -----------------------------------------------------------------------------
// Dealer operations
// -----------------------------------------------------------------------------
domain::BrokerOrderResponse ZmqBridgeConnector::placeDealerOrder(
    const std::string& target_client_id, const domain::Order& order,
    const CallContext& ctx) {
  nlohmann::json args;
  args["target_client_id"] = target_client_id;
  args["order"] = order;
  return decode<domain::BrokerOrderResponse>(
      request("dealer_place_order", std::move(args), ctx),
      "dealer_place_order");
}

domain::OrderBook ZmqBridgeConnector::getDealerOrderBook(
    const std::string& target_client_id, const CallContext& ctx) {
  nlohmann::json args;
  args["target_client_id"] = target_client_id;
  return decode<domain::OrderBook>(
      request("dealer_order_book", std::move(args), ctx), "dealer_order_book");
}

std::vector<domain::BrokerPosition> ZmqBridgeConnector::getDealerPositions(
    const std::string& target_client_id, const CallContext& ctx) {
  nlohmann::json args;
  args["target_client_id"] = target_client_id;
  return decode<std::vector<domain::BrokerPosition>>(
      request("dealer_positions", std::move(args), ctx), "dealer_positions");
}

// -----------------------------------------------------------------------------
// Report stream
// -----------------------------------------------------------------------------
void ZmqBridgeConnector::setExecutionReportHandler(
    ExecutionReportHandler handler) {
  std::lock_guard lock(handler_mutex_);
  handler_ = std::move(handler);
}

void ZmqBridgeConnector::runReports() {
  try {
    zmq::socket_t sub(context_, zmq::socket_type::sub);
    sub.set(zmq::sockopt::linger, 0);
    sub.set(zmq::sockopt::rcvtimeo, kReportPollTimeoutMs);
    sub.set(zmq::sockopt::subscribe, "");
    sub.connect(options_.report_endpoint);

    while (reports_running_.load()) {
      zmq::message_t msg;
      const auto received = sub.recv(msg, zmq::recv_flags::none);
      if (!received.has_value()) {
        continue;
      }
      deliver(std::string(static_cast<const char*>(msg.data()), msg.size()));
    }
  } catch (const zmq::error_t& e) {
    logger_.error(kComponent, "report stream stopped",
                  {{"clientId", client_id_},
                   {"endpoint", options_.report_endpoint},
                   {"reason", e.what()}});
  }
}

void ZmqBridgeConnector::deliver(const std::string& payload) {
  domain::ExecutionReport report;
  try {
    report = nlohmann::json::parse(payload).get<domain::ExecutionReport>();
  } catch (const std::exception& e) {
    logger_.warn(kComponent, "dropping malformed execution report",
                 {{"clientId", client_id_}, {"reason", e.what()}});
    return;
  }

  ExecutionReportHandler handler;
  {
    std::lock_guard lock(handler_mutex_);
    handler = handler_;
  }
  if (handler) {
    handler(report);
  }
}

}  // namespace orex

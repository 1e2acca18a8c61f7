#include "orex/broker/simulated_broker_connector.hpp"

#include "orex/errors/execution_error.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace orex {

using domain::BrokerOrderDetails;
using domain::BrokerOrderResponse;
using domain::OrderStatus;

namespace {

constexpr std::int64_t kSessionLifetimeMs = 8 * 60 * 60 * 1000;

bool isOpen(OrderStatus status) {
  return status == OrderStatus::Pending || status == OrderStatus::Open ||
         status == OrderStatus::PartiallyFilled;
}

std::string positionKey(const std::string& client_id,
                        const std::string& symbol) {
  return client_id + "|" + symbol;
}

}  // namespace

// -----------------------------------------------------------------------------
// optionsFromJson()
// -----------------------------------------------------------------------------
SimulatedBrokerConnector::Options SimulatedBrokerConnector::optionsFromJson(
    const nlohmann::json& params) {
  Options options;
  if (!params.is_object()) {
    return options;
  }

  const std::string mode = params.value("fill_mode", "auto");
  if (mode == "auto") {
    options.fill_mode = FillMode::Auto;
  } else if (mode == "ack") {
    options.fill_mode = FillMode::AckOnly;
  } else if (mode == "none") {
    options.fill_mode = FillMode::None;
  } else {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "unknown fill_mode: " + mode, kComponent);
  }

  options.latency =
      std::chrono::milliseconds(params.value("latency_ms", std::int64_t{10}));
  if (params.contains("reject_symbols")) {
    options.reject_symbols =
        params.at("reject_symbols").get<std::vector<std::string>>();
  }
  options.dealer = params.value("dealer", false);
  options.quote_price = params.value("quote_price", 100.0);
  options.require_login = params.value("require_login", true);
  return options;
}

SimulatedBrokerConnector::SimulatedBrokerConnector(std::string client_id,
                                                   Options options,
                                                   const ITimeProvider& clock,
                                                   ILogger& logger)
    : client_id_(std::move(client_id)),
      options_(std::move(options)),
      clock_(clock),
      logger_(logger) {
  reports_.start();
}

SimulatedBrokerConnector::~SimulatedBrokerConnector() { reports_.stop(); }

// -----------------------------------------------------------------------------
// Connection and session
// -----------------------------------------------------------------------------
void SimulatedBrokerConnector::connect(const CallContext& ctx) {
  ctx.throwIfDone(kComponent, "connect");
  std::lock_guard lock(mutex_);
  connected_ = true;
  logger_.debug(kComponent, "connected", {{"clientId", client_id_}});
}

void SimulatedBrokerConnector::disconnect() {
  std::lock_guard lock(mutex_);
  connected_ = false;
  session_.reset();
}

bool SimulatedBrokerConnector::isConnected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

domain::Session SimulatedBrokerConnector::login(
    const domain::Credentials& credentials, const CallContext& ctx) {
  ctx.throwIfDone(kComponent, "login");
  if (credentials.user_id.empty()) {
    throw ExecutionError::validation(ErrorCode::AuthenticationFailed,
                                     "user ID is required for login",
                                     kComponent);
  }

  std::lock_guard lock(mutex_);
  if (!connected_) {
    throw ExecutionError::network(ErrorCode::NotConnected,
                                  "simulated venue not connected", kComponent);
  }

  domain::Session session;
  session.token = session_ids_.next();
  session.user_id = credentials.user_id;
  session.client_id = client_id_;
  session.expires_at_ms = clock_.now_ms() + kSessionLifetimeMs;
  session_ = session;

  logger_.info(kComponent, "session opened",
               {{"clientId", client_id_}, {"userId", credentials.user_id}});
  return session;
}

void SimulatedBrokerConnector::logout(const CallContext& ctx) {
  ctx.throwIfDone(kComponent, "logout");
  std::lock_guard lock(mutex_);
  session_.reset();
}

void SimulatedBrokerConnector::requireSessionLocked(
    const CallContext& ctx, const std::string& operation) const {
  ctx.throwIfDone(kComponent, operation);
  if (!connected_) {
    throw ExecutionError::network(ErrorCode::NotConnected,
                                  "simulated venue not connected", kComponent);
  }
  if (options_.require_login && !session_) {
    throw ExecutionError::validation(ErrorCode::AuthenticationFailed,
                                     "not logged in", kComponent);
  }
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
BrokerOrderResponse SimulatedBrokerConnector::placeOrder(
    const domain::Order& order, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "placeOrder");
  return placeLocked(order, client_id_);
}

BrokerOrderResponse SimulatedBrokerConnector::placeLocked(
    const domain::Order& order, const std::string& client_id) {
  if (std::find(options_.reject_symbols.begin(), options_.reject_symbols.end(),
                order.symbol) != options_.reject_symbols.end()) {
    throw ExecutionError::validation(ErrorCode::OrderRejected,
                                     "order rejected by venue: symbol " +
                                         order.symbol + " is not tradable",
                                     kComponent)
        .withOrderId(order.id);
  }

  BrokerOrderDetails details;
  details.order_id = order_ids_.next();
  details.exchange_order_id = "X" + details.order_id;
  details.client_id = client_id;
  details.symbol = order.symbol;
  details.exchange = order.exchange;
  details.side = order.side;
  details.order_type = order.order_type;
  details.product_type = order.product_type;
  details.validity = order.validity;
  details.quantity = order.quantity;
  details.price = order.price;
  details.trigger_price = order.trigger_price;
  details.status = OrderStatus::Open;
  details.updated_at_ms = clock_.now_ms();

  orders_.emplace(details.order_id, details);
  order_sequence_.push_back(details.order_id);
  engine_ids_.emplace(details.order_id, order.id);

  BrokerOrderResponse response;
  response.order_id = details.order_id;
  response.exchange_order_id = details.exchange_order_id;
  response.status = OrderStatus::Open;
  response.status_message = "accepted";

  logger_.debug(kComponent, "order accepted",
                {{"clientId", client_id},
                 {"orderId", order.id},
                 {"brokerOrderId", details.order_id}});

  if (options_.fill_mode != FillMode::None) {
    domain::ExecutionReport ack;
    ack.order_id = order.id;
    ack.broker_order_id = details.order_id;
    ack.status = OrderStatus::Open;
    ack.message = "accepted";
    ack.timestamp_ms = clock_.now_ms();
    emit(ack);
  }
  if (options_.fill_mode == FillMode::Auto) {
    const double price = order.order_type == domain::OrderType::Market ||
                                 order.order_type ==
                                     domain::OrderType::StopLossMarket
                             ? options_.quote_price
                             : order.price;
    applyFillLocked(orders_.at(details.order_id), order.quantity, price);
  }
  return response;
}

BrokerOrderDetails& SimulatedBrokerConnector::findLocked(
    const std::string& broker_order_id) {
  auto it = orders_.find(broker_order_id);
  if (it == orders_.end()) {
    throw ExecutionError::validation(ErrorCode::OrderNotFound,
                                     "unknown broker order ID: " +
                                         broker_order_id,
                                     kComponent);
  }
  return it->second;
}

BrokerOrderResponse SimulatedBrokerConnector::cancelOrder(
    const std::string& broker_order_id, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "cancelOrder");
  BrokerOrderDetails& details = findLocked(broker_order_id);
  if (!isOpen(details.status)) {
    throw ExecutionError::validation(
        ErrorCode::OrderRejected,
        "order " + broker_order_id + " is not open (" +
            domain::toString(details.status) + ")",
        kComponent);
  }

  details.status = OrderStatus::Cancelled;
  details.updated_at_ms = clock_.now_ms();

  domain::ExecutionReport report;
  report.order_id = engine_ids_[broker_order_id];
  report.broker_order_id = broker_order_id;
  report.status = OrderStatus::Cancelled;
  report.filled_quantity = details.filled_quantity;
  report.fill_price = details.average_price;
  report.message = "cancelled";
  report.timestamp_ms = details.updated_at_ms;
  emit(report);

  BrokerOrderResponse response;
  response.order_id = broker_order_id;
  response.exchange_order_id = details.exchange_order_id;
  response.status = OrderStatus::Cancelled;
  response.status_message = "cancelled";
  return response;
}

BrokerOrderResponse SimulatedBrokerConnector::modifyOrder(
    const std::string& broker_order_id,
    const domain::OrderModification& modification, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "modifyOrder");
  BrokerOrderDetails& details = findLocked(broker_order_id);
  if (!isOpen(details.status)) {
    throw ExecutionError::validation(ErrorCode::OrderRejected,
                                     "order " + broker_order_id +
                                         " is not open",
                                     kComponent);
  }
  if (modification.quantity &&
      *modification.quantity < details.filled_quantity) {
    throw ExecutionError::validation(
        ErrorCode::InvalidParameter,
        "quantity cannot be reduced below the filled quantity", kComponent);
  }

  if (modification.price) {
    details.price = *modification.price;
  }
  if (modification.quantity) {
    details.quantity = *modification.quantity;
  }
  if (modification.trigger_price) {
    details.trigger_price = *modification.trigger_price;
  }
  details.updated_at_ms = clock_.now_ms();

  BrokerOrderResponse response;
  response.order_id = broker_order_id;
  response.exchange_order_id = details.exchange_order_id;
  response.status = details.status;
  response.status_message = "modified";
  return response;
}

BrokerOrderDetails SimulatedBrokerConnector::getOrderStatus(
    const std::string& broker_order_id, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "getOrderStatus");
  return findLocked(broker_order_id);
}

// -----------------------------------------------------------------------------
// fill(): externally driven execution
// -----------------------------------------------------------------------------
void SimulatedBrokerConnector::fill(const std::string& broker_order_id,
                                    std::int64_t quantity, double price) {
  std::lock_guard lock(mutex_);
  BrokerOrderDetails& details = findLocked(broker_order_id);
  if (!isOpen(details.status)) {
    throw ExecutionError::validation(ErrorCode::OrderRejected,
                                     "order " + broker_order_id +
                                         " is not open",
                                     kComponent);
  }
  applyFillLocked(details, quantity, price);
}

void SimulatedBrokerConnector::applyFillLocked(BrokerOrderDetails& details,
                                               std::int64_t quantity,
                                               double price) {
  const std::int64_t remaining = details.quantity - details.filled_quantity;
  const std::int64_t executed = std::min(quantity, remaining);
  if (executed <= 0) {
    return;
  }

  const double notional =
      details.average_price * static_cast<double>(details.filled_quantity) +
      price * static_cast<double>(executed);
  details.filled_quantity += executed;
  details.average_price =
      notional / static_cast<double>(details.filled_quantity);
  details.status = details.filled_quantity == details.quantity
                       ? OrderStatus::Filled
                       : OrderStatus::PartiallyFilled;
  details.updated_at_ms = clock_.now_ms();

  domain::BrokerPosition& pos =
      positions_[positionKey(details.client_id, details.symbol)];
  pos.client_id = details.client_id;
  pos.symbol = details.symbol;
  pos.exchange = details.exchange;
  pos.product_type = details.product_type;
  if (details.side == domain::Side::Buy) {
    pos.buy_quantity += executed;
  } else {
    pos.sell_quantity += executed;
  }
  pos.net_quantity = pos.buy_quantity - pos.sell_quantity;
  pos.average_price = details.average_price;
  pos.last_price = price;

  domain::ExecutionReport report;
  report.order_id = engine_ids_[details.order_id];
  report.broker_order_id = details.order_id;
  report.status = details.status;
  report.filled_quantity = details.filled_quantity;
  report.fill_price = details.average_price;
  report.message = "fill";
  report.timestamp_ms = details.updated_at_ms;
  emit(report);
}

// -----------------------------------------------------------------------------
// emit(): deliver on the worker after the configured latency
// -----------------------------------------------------------------------------
void SimulatedBrokerConnector::emit(domain::ExecutionReport report) {
  const auto latency = options_.latency;
  reports_.post([this, latency, report = std::move(report)] {
    if (latency.count() > 0) {
      std::this_thread::sleep_for(latency);
    }
    ExecutionReportHandler handler;
    {
      std::lock_guard lock(mutex_);
      handler = handler_;
    }
    if (handler) {
      handler(report);
    }
  });
}

bool SimulatedBrokerConnector::waitForReports(
    std::chrono::milliseconds timeout) {
  return reports_.waitIdle(timeout);
}

void SimulatedBrokerConnector::setExecutionReportHandler(
    ExecutionReportHandler handler) {
  std::lock_guard lock(mutex_);
  handler_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// Book, positions, holdings
// -----------------------------------------------------------------------------
domain::OrderBook SimulatedBrokerConnector::getOrderBook(
    const CallContext& ctx) {
  return getDealerOrderBook(client_id_, ctx);
}

std::vector<domain::BrokerPosition> SimulatedBrokerConnector::getPositions(
    const CallContext& ctx) {
  return getDealerPositions(client_id_, ctx);
}

std::vector<domain::Holding> SimulatedBrokerConnector::getHoldings(
    const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "getHoldings");
  std::vector<domain::Holding> out;
  for (const auto& [key, pos] : positions_) {
    if (pos.client_id != client_id_ ||
        pos.product_type != domain::ProductType::Delivery ||
        pos.net_quantity <= 0) {
      continue;
    }
    domain::Holding holding;
    holding.client_id = pos.client_id;
    holding.symbol = pos.symbol;
    holding.exchange = pos.exchange;
    holding.quantity = pos.net_quantity;
    holding.average_price = pos.average_price;
    holding.last_price = pos.last_price;
    out.push_back(holding);
  }
  return out;
}

domain::Quote SimulatedBrokerConnector::getQuote(const std::string& symbol,
                                                 const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "getQuote");
  const double px = options_.quote_price;
  domain::Quote quote;
  quote.symbol = symbol;
  quote.last_price = px;
  quote.open = px;
  quote.high = px;
  quote.low = px;
  quote.close = px;
  quote.bid_price = px - 0.05;
  quote.ask_price = px + 0.05;
  quote.bid_size = 100;
  quote.ask_size = 100;
  quote.timestamp_ms = clock_.now_ms();
  return quote;
}

void SimulatedBrokerConnector::subscribeQuotes(
    const std::vector<std::string>& symbols, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "subscribeQuotes");
  subscriptions_.insert(symbols.begin(), symbols.end());
}

void SimulatedBrokerConnector::unsubscribeQuotes(
    const std::vector<std::string>& symbols, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "unsubscribeQuotes");
  for (const auto& symbol : symbols) {
    subscriptions_.erase(symbol);
  }
}

// -----------------------------------------------------------------------------
// Dealer operations
// -----------------------------------------------------------------------------
BrokerOrderResponse SimulatedBrokerConnector::placeDealerOrder(
    const std::string& target_client_id, const domain::Order& order,
    const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "placeDealerOrder");
  return placeLocked(order, target_client_id);
}

domain::OrderBook SimulatedBrokerConnector::getDealerOrderBook(
    const std::string& target_client_id, const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "getOrderBook");
  domain::OrderBook book;
  for (const auto& id : order_sequence_) {
    const BrokerOrderDetails& details = orders_.at(id);
    if (details.client_id == target_client_id) {
      book.orders.push_back(details);
    }
  }
  return book;
}

std::vector<domain::BrokerPosition>
SimulatedBrokerConnector::getDealerPositions(const std::string& target_client_id,
                                             const CallContext& ctx) {
  std::lock_guard lock(mutex_);
  requireSessionLocked(ctx, "getPositions");
  std::vector<domain::BrokerPosition> out;
  for (const auto& [key, pos] : positions_) {
    if (pos.client_id == target_client_id) {
      out.push_back(pos);
    }
  }
  return out;
}

std::size_t SimulatedBrokerConnector::orderCount() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

std::set<std::string> SimulatedBrokerConnector::subscriptions() const {
  std::lock_guard lock(mutex_);
  return subscriptions_;
}

}  // namespace orex

#include "orex/broker/broker_router.hpp"

#include "orex/errors/execution_error.hpp"

#include <exception>
#include <mutex>
#include <utility>

namespace orex {

const char* toString(DealerFallback policy) {
  switch (policy) {
    case DealerFallback::Account: return "account";
    case DealerFallback::Reject:  return "reject";
  }
  return "unknown";
}

std::optional<DealerFallback> parseDealerFallback(std::string_view text) {
  if (text == "account") {
    return DealerFallback::Account;
  }
  if (text == "reject") {
    return DealerFallback::Reject;
  }
  return std::nullopt;
}

BrokerRouter::BrokerRouter(std::shared_ptr<BrokerConnectorFactory> factory,
                           CircuitBreakerRegistry& breakers,
                           IErrorHandler& errors, ILogger& logger,
                           BrokerRouterOptions options)
    : factory_(std::move(factory)),
      breakers_(breakers),
      errors_(errors),
      logger_(logger),
      options_(options) {}

BrokerRouter::~BrokerRouter() { shutdown(); }

// -----------------------------------------------------------------------------
// registerBroker()
// -----------------------------------------------------------------------------
void BrokerRouter::registerBroker(const std::string& client_id,
                                  const domain::BrokerConfig& config) {
  if (client_id.empty()) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "client ID is required", kComponent);
  }
  if (config.type.empty()) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "broker configuration is required",
                                     kComponent);
  }

  std::shared_ptr<IBrokerConnector> replaced;
  {
    std::unique_lock lock(mutex_);
    configs_[client_id] = config;
    auto it = clients_.find(client_id);
    if (it != clients_.end()) {
      replaced = std::move(it->second);
      clients_.erase(it);
    }
  }

  if (replaced) {
    replaced->disconnect();
  }

  logger_.info(kComponent, "broker registered",
               {{"clientId", client_id},
                {"type", config.type},
                {"destination", config.destination}});
}

// -----------------------------------------------------------------------------
// getBrokerClient(): double-checked lazy construction
// -----------------------------------------------------------------------------
std::shared_ptr<IBrokerConnector> BrokerRouter::getBrokerClient(
    const std::string& client_id) {
  {
    std::shared_lock lock(mutex_);
    auto it = clients_.find(client_id);
    if (it != clients_.end()) {
      return it->second;
    }
  }

  std::shared_ptr<IBrokerConnector> created;
  {
    std::unique_lock lock(mutex_);
    auto it = clients_.find(client_id);
    if (it != clients_.end()) {
      return it->second;
    }

    auto config = configs_.find(client_id);
    if (config == configs_.end()) {
      throw ExecutionError::validation(
          ErrorCode::InvalidParameter,
          "no configuration found for client ID: " + client_id, kComponent);
    }

    try {
      created = factory_->create(client_id, config->second);
    } catch (const ExecutionError& e) {
      throw ExecutionError::validation(
          ErrorCode::InvalidParameter,
          "failed to create broker client: " + e.message(), kComponent)
          .withCause(std::current_exception());
    } catch (const std::exception& e) {
      throw ExecutionError::validation(
          ErrorCode::InvalidParameter,
          std::string("failed to create broker client: ") + e.what(),
          kComponent)
          .withCause(std::current_exception());
    }
    if (!created) {
      throw ExecutionError::validation(
          ErrorCode::InvalidParameter,
          "failed to create broker client: factory returned no connector",
          kComponent);
    }

    // Observed before it is published, so no caller can place an order on
    // a connector whose report handler is not installed yet.
    ConnectorObserver observer;
    {
      std::lock_guard observer_lock(observer_mutex_);
      observer = observer_;
    }
    if (observer) {
      observer(client_id, created);
    }
    clients_.emplace(client_id, created);
  }

  logger_.info(kComponent, "broker client created", {{"clientId", client_id}});
  return created;
}

std::string BrokerRouter::getClientIdForUser(const std::string& user_id) const {
  if (user_id.empty()) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "user ID is required", kComponent);
  }
  std::shared_lock lock(session_mutex_);
  auto it = user_to_client_.find(user_id);
  if (it == user_to_client_.end()) {
    throw ExecutionError::validation(
        ErrorCode::InvalidParameter,
        "no active session found for user ID: " + user_id, kComponent);
  }
  return it->second;
}

std::optional<std::string> BrokerRouter::sessionClient(
    const std::string& user_id) const {
  std::shared_lock lock(session_mutex_);
  auto it = user_to_client_.find(user_id);
  if (it == user_to_client_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> BrokerRouter::registeredClients() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(configs_.size());
  for (const auto& [client_id, config] : configs_) {
    out.push_back(client_id);
  }
  return out;
}

std::string BrokerRouter::destinationFor(const std::string& client_id) const {
  std::shared_lock lock(mutex_);
  auto it = configs_.find(client_id);
  if (it == configs_.end() || it->second.destination.empty()) {
    return client_id;
  }
  return it->second.destination;
}

void BrokerRouter::setConnectorObserver(ConnectorObserver observer) {
  std::lock_guard lock(observer_mutex_);
  observer_ = std::move(observer);
}

CallContext BrokerRouter::effectiveContext(const CallContext& ctx) const {
  if (ctx.hasDeadline()) {
    return ctx;
  }
  return CallContext::withTimeout(options_.call_timeout, ctx.token());
}

// -----------------------------------------------------------------------------
// route(): breaker + classifier around one connector call
// -----------------------------------------------------------------------------
template <typename T, typename Fn>
RouteResult<T> BrokerRouter::route(const std::string& context,
                                   const ClientResolver& resolve,
                                   const CallContext& ctx, Fn&& fn) {
  std::optional<ExecutionError> failure;
  try {
    const std::string client_id = resolve();
    std::shared_ptr<IBrokerConnector> connector = getBrokerClient(client_id);
    std::shared_ptr<CircuitBreaker> breaker =
        breakers_.get(destinationFor(client_id));

    const CallContext call_ctx = effectiveContext(ctx);
    T value = breaker->execute([&]() -> T {
      call_ctx.throwIfDone(kComponent, context);
      return fn(*connector, call_ctx);
    });

    errors_.releaseContext(context);
    return RouteResult<T>::success(std::move(value));
  } catch (const ExecutionError& e) {
    failure = e;
  } catch (const std::exception&) {
    failure = toExecutionError(std::current_exception(), kComponent);
  }

  RetryDecision decision = errors_.handleError(context, *failure);
  if (!decision.should_retry) {
    errors_.releaseContext(context);
  }
  return RouteResult<T>::failure(decision);
}

std::string BrokerRouter::resolveDealer(const std::string& user_id,
                                        const std::string& target_client_id,
                                        const char* operation,
                                        bool& fallback) {
  const std::string dealer_client = getClientIdForUser(user_id);
  std::shared_ptr<IBrokerConnector> connector = getBrokerClient(dealer_client);
  if (connector->dealerOperations() != nullptr) {
    fallback = false;
    return dealer_client;
  }

  if (options_.dealer_fallback == DealerFallback::Reject) {
    throw ExecutionError::validation(
        ErrorCode::UnsupportedOperation,
        "dealer operations not supported by this broker", kComponent);
  }

  logger_.warn(kComponent, "dealer capability missing, falling back",
               {{"operation", operation},
                {"clientId", dealer_client},
                {"targetClientId", target_client_id}});
  fallback = true;
  return target_client_id;
}

// -----------------------------------------------------------------------------
// Sessions
// -----------------------------------------------------------------------------
RouteResult<domain::Session> BrokerRouter::login(
    const std::string& client_id, const domain::Credentials& credentials,
    const CallContext& ctx) {
  auto result = route<domain::Session>(
      "login:" + client_id, [&] { return client_id; }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        if (!c.isConnected()) {
          c.connect(call_ctx);
        }
        return c.login(credentials, call_ctx);
      });

  if (result.ok()) {
    const std::string user_id = result.value->user_id.empty()
                                    ? credentials.user_id
                                    : result.value->user_id;
    {
      std::unique_lock lock(session_mutex_);
      user_to_client_[user_id] = client_id;
    }
    logger_.info(kComponent, "session established",
                 {{"clientId", client_id}, {"userId", user_id}});
  }
  return result;
}

RouteResult<Ack> BrokerRouter::logout(const std::string& client_id,
                                      const CallContext& ctx) {
  {
    std::unique_lock lock(session_mutex_);
    for (auto it = user_to_client_.begin(); it != user_to_client_.end();) {
      if (it->second == client_id) {
        it = user_to_client_.erase(it);
      } else {
        ++it;
      }
    }
  }

  return route<Ack>("logout:" + client_id, [&] { return client_id; }, ctx,
                    [](IBrokerConnector& c, const CallContext& call_ctx) {
                      c.logout(call_ctx);
                      return Ack{};
                    });
}

// -----------------------------------------------------------------------------
// User-scoped operations
// -----------------------------------------------------------------------------
RouteResult<domain::BrokerOrderResponse> BrokerRouter::placeOrder(
    const std::string& user_id, const domain::Order& order,
    const CallContext& ctx) {
  return route<domain::BrokerOrderResponse>(
      "place:" + order.id, [&] { return getClientIdForUser(user_id); }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.placeOrder(order, call_ctx);
      });
}

RouteResult<domain::BrokerOrderResponse> BrokerRouter::modifyOrder(
    const std::string& user_id, const std::string& broker_order_id,
    const domain::OrderModification& modification, const CallContext& ctx) {
  return route<domain::BrokerOrderResponse>(
      "modify:" + broker_order_id,
      [&] { return getClientIdForUser(user_id); }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.modifyOrder(broker_order_id, modification, call_ctx);
      });
}

RouteResult<domain::BrokerOrderResponse> BrokerRouter::cancelOrder(
    const std::string& user_id, const std::string& broker_order_id,
    const CallContext& ctx) {
  return route<domain::BrokerOrderResponse>(
      "cancel:" + broker_order_id,
      [&] { return getClientIdForUser(user_id); }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.cancelOrder(broker_order_id, call_ctx);
      });
}

RouteResult<domain::BrokerOrderDetails> BrokerRouter::getOrderStatus(
    const std::string& user_id, const std::string& broker_order_id,
    const CallContext& ctx) {
  return route<domain::BrokerOrderDetails>(
      "status:" + broker_order_id,
      [&] { return getClientIdForUser(user_id); }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.getOrderStatus(broker_order_id, call_ctx);
      });
}

RouteResult<domain::OrderBook> BrokerRouter::getOrderBook(
    const std::string& user_id, const CallContext& ctx) {
  return route<domain::OrderBook>(
      "orderbook:" + user_id, [&] { return getClientIdForUser(user_id); }, ctx,
      [](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.getOrderBook(call_ctx);
      });
}

RouteResult<std::vector<domain::BrokerPosition>> BrokerRouter::getPositions(
    const std::string& user_id, const CallContext& ctx) {
  return route<std::vector<domain::BrokerPosition>>(
      "positions:" + user_id, [&] { return getClientIdForUser(user_id); }, ctx,
      [](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.getPositions(call_ctx);
      });
}

RouteResult<std::vector<domain::Holding>> BrokerRouter::getHoldings(
    const std::string& user_id, const CallContext& ctx) {
  return route<std::vector<domain::Holding>>(
      "holdings:" + user_id, [&] { return getClientIdForUser(user_id); }, ctx,
      [](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.getHoldings(call_ctx);
      });
}

RouteResult<domain::Quote> BrokerRouter::getQuote(const std::string& user_id,
                                                  const std::string& symbol,
                                                  const CallContext& ctx) {
  return route<domain::Quote>(
      "quote:" + user_id + ":" + symbol,
      [&] { return getClientIdForUser(user_id); }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        return c.getQuote(symbol, call_ctx);
      });
}

RouteResult<Ack> BrokerRouter::subscribeQuotes(
    const std::string& user_id, const std::vector<std::string>& symbols,
    const CallContext& ctx) {
  return route<Ack>(
      "subscribe:" + user_id, [&] { return getClientIdForUser(user_id); }, ctx,
      [&](IBrokerConnector& c, const CallContext& call_ctx) {
        c.subscribeQuotes(symbols, call_ctx);
        return Ack{};
      });
}

RouteResult<Ack> BrokerRouter::unsubscribeQuotes(
    const std::string& user_id, const std::vector<std::string>& symbols,
    const CallContext& ctx) {
  return route<Ack>(
      "unsubscribe:" + user_id, [&] { return getClientIdForUser(user_id); },
      ctx, [&](IBrokerConnector& c, const CallContext& call_ctx) {
        c.unsubscribeQuotes(symbols, call_ctx);
        return Ack{};
      });
}

// -----------------------------------------------------------------------------
// Dealer operations
// -----------------------------------------------------------------------------
RouteResult<domain::BrokerOrderResponse> BrokerRouter::placeDealerOrder(
    const std::string& user_id, const std::string& target_client_id,
    const domain::Order& order, const CallContext& ctx) {
  bool fallback = false;
  return route<domain::BrokerOrderResponse>(
      "dealer-place:" + order.id,
      [&] {
        return resolveDealer(user_id, target_client_id, "placeDealerOrder",
                             fallback);
      },
      ctx, [&](IBrokerConnector& c, const CallContext& call_ctx) {
        if (fallback) {
          return c.placeOrder(order, call_ctx);
        }
        return c.dealerOperations()->placeDealerOrder(target_client_id, order,
                                                      call_ctx);
      });
}

RouteResult<domain::OrderBook> BrokerRouter::getDealerOrderBook(
    const std::string& user_id, const std::string& target_client_id,
    const CallContext& ctx) {
  bool fallback = false;
  return route<domain::OrderBook>(
      "dealer-orderbook:" + target_client_id,
      [&] {
        return resolveDealer(user_id, target_client_id, "getDealerOrderBook",
                             fallback);
      },
      ctx, [&](IBrokerConnector& c, const CallContext& call_ctx) {
        if (fallback) {
          return c.getOrderBook(call_ctx);
        }
        return c.dealerOperations()->getDealerOrderBook(target_client_id,
                                                        call_ctx);
      });
}

RouteResult<std::vector<domain::BrokerPosition>>
BrokerRouter::getDealerPositions(const std::string& user_id,
                                 const std::string& target_client_id,
                                 const CallContext& ctx) {
  bool fallback = false;
  return route<std::vector<domain::BrokerPosition>>(
      "dealer-positions:" + target_client_id,
      [&] {
        return resolveDealer(user_id, target_client_id, "getDealerPositions",
                             fallback);
      },
      ctx, [&](IBrokerConnector& c, const CallContext& call_ctx) {
        if (fallback) {
          return c.getPositions(call_ctx);
        }
        return c.dealerOperations()->getDealerPositions(target_client_id,
                                                        call_ctx);
      });
}

// -----------------------------------------------------------------------------
// shutdown()
// -----------------------------------------------------------------------------
void BrokerRouter::shutdown() {
  std::unordered_map<std::string, std::shared_ptr<IBrokerConnector>> clients;
  {
    std::unique_lock lock(mutex_);
    clients.swap(clients_);
  }
  {
    std::unique_lock lock(session_mutex_);
    user_to_client_.clear();
  }
  for (auto& [client_id, connector] : clients) {
    connector->disconnect();
  }
  if (!clients.empty()) {
    logger_.info(kComponent, "router shut down",
                 {{"connectors", clients.size()}});
  }
}

}  // namespace orex

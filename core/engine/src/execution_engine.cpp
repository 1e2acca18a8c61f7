#include "orex/engine/execution_engine.hpp"

#include "orex/domain/json_codec.hpp"
#include "orex/risk/auditing_risk_manager.hpp"
#include "orex/risk/risk_manager.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace orex {

using domain::LifecycleState;
using domain::OrderStatus;

namespace {

bool atVenue(LifecycleState state) {
  return state == LifecycleState::Submitted ||
         state == LifecycleState::Acknowledged ||
         state == LifecycleState::PartiallyFilled ||
         state == LifecycleState::Cancelling;
}

nlohmann::json errorMetadata(const ExecutionError& error) {
  nlohmann::json meta;
  meta["code"] = toString(error.code());
  meta["reason"] = error.message();
  return meta;
}

nlohmann::json errorResponse(const std::string& message) {
  return {{"status", "error"}, {"error", message}};
}

// Upper bound on the worker tasks stop() lets finish before joining.
constexpr auto kStopDrainTimeout = std::chrono::milliseconds(5'000);

}  // namespace

nlohmann::json toJson(const SubmissionResult& result) {
  nlohmann::json j;
  j["order_id"] = result.order_id;
  j["state"] = domain::toString(result.state);
  j["broker_order_id"] = result.broker_order_id;
  j["attempts"] = result.attempts;
  j["accepted"] = result.accepted();
  if (result.error) {
    j["error"] = result.error->toJson();
  }
  return j;
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------
ExecutionEngine::ExecutionEngine(EngineConfig config,
                                 const ITimeProvider& clock, ILogger& logger,
                                 std::shared_ptr<BrokerConnectorFactory> factory)
    : config_(std::move(config)),
      clock_(clock),
      logger_(logger),
      factory_(std::move(factory)),
      errors_(config_.error_handling, logger_),
      breakers_(config_.circuit_breaker.defaults, clock_, logger_),
      risk_(std::make_unique<AuditingRiskManager>(
          std::make_unique<RiskManager>(config_.risk.limits, clock_, logger_),
          errors_, logger_)),
      lifecycles_(clock_, logger_),
      monitor_(config_.monitoring, lifecycles_, clock_, logger_),
      dependencies_(std::make_unique<OrderDependencyManager>(
          lifecycles_, errors_, clock_, logger_)),
      router_(std::make_unique<BrokerRouter>(
          factory_, breakers_, errors_, logger_,
          BrokerRouterOptions{config_.dealer_fallback,
                              config_.engine.call_timeout})),
      dead_letters_(config_.engine.dead_letter_capacity, clock_, logger_),
      stop_token_(std::make_shared<CancellationToken>()) {
  if (!factory_) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "connector factory is required",
                                     kComponent);
  }

  for (const auto& [name, breaker] : config_.circuit_breaker.overrides) {
    breakers_.setOverride(name, breaker);
  }
  for (const auto& profile : config_.risk.profiles) {
    risk_->createRiskProfile(profile);
  }
  for (const auto& [client_id, broker] : config_.brokers) {
    router_->registerBroker(client_id, broker);
  }

  router_->setConnectorObserver(
      [this](const std::string& client_id,
             const std::shared_ptr<IBrokerConnector>& connector) {
        logger_.debug(kComponent, "subscribing to execution reports",
                      {{"clientId", client_id}});
        connector->setExecutionReportHandler(
            [this](const domain::ExecutionReport& report) {
              onExecutionReport(report);
            });
      });

  OrderDependencyManager::Hooks hooks;
  hooks.on_child_triggered = [this](const domain::OrderLifecycle& child) {
    onChildTriggered(child);
  };
  hooks.cancel_child = [this](const domain::OrderId& child_id) {
    onOcoCancel(child_id);
  };
  dependencies_->setHooks(std::move(hooks));

  monitor_.setAlertSink(
      [this](const OrderAlert& alert) { publishAlert(alert); });

  for (LifecycleState state : domain::kAllLifecycleStates) {
    lifecycle_subscriptions_.push_back(lifecycles_.registerCallback(
        state, [this](const domain::OrderLifecycle& lifecycle,
                      const domain::OrderEvent& event) {
          publish(lifecycle, event);
        }));
  }

  logger_.info(kComponent, "engine constructed",
               {{"brokers", config_.brokers.size()},
                {"riskProfiles", config_.risk.profiles.size()},
                {"maxRetries", config_.error_handling.max_retries}});
}

ExecutionEngine::~ExecutionEngine() {
  stop();
  // A never-started engine still has the dependency worker running.
  dependencies_->stop();
  worker_.stop();
  for (auto id : lifecycle_subscriptions_) {
    lifecycles_.unregisterCallback(id);
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ExecutionEngine::start() {
  if (running_.load()) {
    return;
  }

  {
    std::lock_guard lock(stop_mutex_);
    stop_token_ = std::make_shared<CancellationToken>();
    running_.store(true);
  }
  worker_.start();
  dependencies_->start();
  maintenance_thread_ = std::thread([this] { runMaintenance(); });

  for (const auto& [client_id, credentials] : config_.sessions) {
    auto result = router_->login(client_id, credentials, callContext());
    if (!result.ok()) {
      logger_.error(kComponent, "session login failed",
                    {{"clientId", client_id},
                     {"userId", credentials.user_id},
                     {"error", result.error->message()}});
    }
  }

  if (!config_.control.command_endpoint.empty() &&
      !config_.control.telemetry_endpoint.empty()) {
    auto server = std::make_unique<ControlServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.control.command_endpoint, config_.control.telemetry_endpoint,
        logger_);
    try {
      server->start();
    } catch (const zmq::error_t& e) {
      logger_.error(kComponent, "control server failed to bind",
                    {{"command", config_.control.command_endpoint},
                     {"telemetry", config_.control.telemetry_endpoint},
                     {"reason", e.what()}});
      stop();
      throw ExecutionError::system(
          ErrorCode::ConnectionFailed,
          std::string("cannot bind control endpoints: ") + e.what(),
          kComponent, std::current_exception());
    }
    ControlServer* raw = server.get();
    control_server_ = std::move(server);
    setTelemetrySink(
        [raw](const nlohmann::json& message) { raw->pushTelemetry(message); });
  }

  logger_.info(kComponent, "engine started",
               {{"sessions", config_.sessions.size()},
                {"controlPlane", control_server_ != nullptr}});
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ExecutionEngine::stop() {
  {
    std::lock_guard lock(stop_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
    stop_token_->cancel();
  }
  stop_cv_.notify_all();

  // The sink points into the control server.
  setTelemetrySink(nullptr);
  control_server_.reset();

  if (maintenance_thread_.joinable()) {
    maintenance_thread_.join();
  }

  // Dependency triggers post to the worker, so they stop first. What the
  // worker already holds runs to its end against the cancelled token.
  dependencies_->stop();
  if (!worker_.waitIdle(kStopDrainTimeout)) {
    logger_.warn(kComponent, "worker tasks still pending at stop",
                 {{"timeoutMs", kStopDrainTimeout.count()}});
  }
  worker_.stop();
  router_->shutdown();

  logger_.info(kComponent, "engine stopped",
               {{"lifecycles", lifecycles_.size()},
                {"deadLetters", dead_letters_.size()}});
}

// -----------------------------------------------------------------------------
// submitOrder()
// -----------------------------------------------------------------------------
SubmissionResult ExecutionEngine::submitOrder(const std::string& user_id,
                                              const domain::Order& order,
                                              const domain::Portfolio& portfolio,
                                              const domain::Strategy& strategy) {
  lifecycles_.createLifecycle(order);
  {
    std::lock_guard lock(contexts_mutex_);
    contexts_[order.id] = OrderContext{user_id, portfolio, strategy};
  }

  SubmissionResult result;
  result.order_id = order.id;

  try {
    risk_->validateOrder(order, portfolio, strategy);
  } catch (const ExecutionError& e) {
    transitionQuietly(order.id, LifecycleState::Rejected, "RISK_REJECTED",
                      errorMetadata(e));
    result.state = lifecycles_.getLifecycle(order.id).current_state;
    result.error = e.withOrderId(order.id);
    return result;
  }

  lifecycles_.transitionState(order.id, LifecycleState::Validated,
                              "VALIDATION_PASSED");

  if (order.parent_order_id && !order.parent_order_id->empty()) {
    const domain::OrderId& parent_id = *order.parent_order_id;
    try {
      dependencies_->createDependency(
          parent_id, order.id, domain::DependencyType::OneTriggersOther);
    } catch (const ExecutionError& e) {
      transitionQuietly(order.id, LifecycleState::Rejected,
                        "DEPENDENCY_REJECTED", errorMetadata(e));
      result.state = lifecycles_.getLifecycle(order.id).current_state;
      result.error = e.withOrderId(order.id);
      return result;
    }

    // A parent that finished before the link existed will not fire again.
    const LifecycleState parent_state =
        lifecycles_.getLifecycle(parent_id).current_state;
    if (parent_state == LifecycleState::Completed) {
      dependencies_->onParentCompleted(parent_id);
    } else if (OrderLifecycleManager::isTerminal(parent_state)) {
      dependencies_->onParentTerminated(parent_id, parent_state);
    }

    logger_.info(kComponent, "child order waiting on parent",
                 {{"orderId", order.id}, {"parentId", parent_id}});
    result.state = lifecycles_.getLifecycle(order.id).current_state;
    return result;
  }

  return place(order.id, false);
}

// -----------------------------------------------------------------------------
// withRetry(): the submission loop
// -----------------------------------------------------------------------------
// Once stop() cancels the token the sleep returns at once and the next call
// fails fast with Cancelled, which the classifier marks final. That final
// decision is what releases the router's retry context.
// -----------------------------------------------------------------------------
template <typename T, typename Call>
RouteResult<T> ExecutionEngine::withRetry(Call&& call) {
  for (;;) {
    RouteResult<T> result = call(callContext());
    if (result.ok() || !result.should_retry) {
      return result;
    }
    logger_.debug(kComponent, "backing off before retry",
                  {{"attempt", result.attempt},
                   {"delayMs", result.retry_delay.count()}});
    sleepUnlessStopped(result.retry_delay);
  }
}

// -----------------------------------------------------------------------------
// place()
// -----------------------------------------------------------------------------
SubmissionResult ExecutionEngine::place(const domain::OrderId& order_id,
                                        bool already_submitted) {
  SubmissionResult result;
  result.order_id = order_id;

  // Before the read, so a concurrent modifyOrder() either lands in the
  // order placed here or is refused.
  const PlacementGuard placing(*this, order_id);
  const domain::Order order = lifecycles_.getLifecycle(order_id).order;
  const auto context = contextFor(order_id);
  const std::string user_id = context ? context->user_id : std::string();

  int attempts = 0;
  auto routed = withRetry<domain::BrokerOrderResponse>(
      [&](const CallContext& ctx) {
        ++attempts;
        return placeAtVenue(user_id, order, ctx);
      });
  result.attempts = attempts;

  if (!routed.ok()) {
    const ExecutionError error = routed.error->withOrderId(order_id);
    result.error = error;

    nlohmann::json meta = errorMetadata(error);
    meta["attempts"] = attempts;
    if (isValidationError(error)) {
      transitionQuietly(order_id, LifecycleState::Rejected, "BROKER_REJECTED",
                        meta);
    } else {
      transitionQuietly(order_id, LifecycleState::Failed, "SUBMISSION_FAILED",
                        meta);
      dead_letters_.add(order, error, user_id, attempts);
    }
    {
      std::lock_guard lock(reports_mutex_);
      pending_reports_.erase(order_id);
    }
    result.state = lifecycles_.getLifecycle(order_id).current_state;
    return result;
  }

  const domain::BrokerOrderResponse& response = *routed.value;
  result.broker_order_id = response.order_id;
  {
    std::lock_guard lock(contexts_mutex_);
    broker_to_order_[response.order_id] = order_id;
  }

  const auto set_broker_id = [&response](domain::Order& o) {
    o.broker_order_id = response.order_id;
  };

  bool recorded = false;
  {
    std::lock_guard lock(reports_mutex_);
    const LifecycleState current =
        lifecycles_.getLifecycle(order_id).current_state;

    if (already_submitted && current == LifecycleState::Submitted) {
      lifecycles_.updateOrder(order_id, set_broker_id);
      recorded = true;
    } else if (!already_submitted && current == LifecycleState::Validated) {
      nlohmann::json meta;
      meta["brokerOrderId"] = response.order_id;
      meta["attempts"] = attempts;
      recorded = transitionQuietly(order_id, LifecycleState::Submitted,
                                   "ORDER_SUBMITTED", meta, set_broker_id);
    }

    if (recorded) {
      auto pending = pending_reports_.find(order_id);
      if (pending != pending_reports_.end()) {
        std::vector<domain::ExecutionReport> buffered =
            std::move(pending->second);
        pending_reports_.erase(pending);
        for (const auto& report : buffered) {
          applyReportLocked(order_id, report);
        }
      }
    } else {
      pending_reports_.erase(order_id);
    }
  }

  if (!recorded) {
    // Cancelled locally while the placement was in flight.
    lifecycles_.updateOrder(order_id, set_broker_id);
    cancelStrayVenueOrder(order_id, user_id, response.order_id);
    result.state = lifecycles_.getLifecycle(order_id).current_state;
    result.error = ExecutionError::execution(
                       ErrorCode::Cancelled,
                       "order was cancelled while being placed", kComponent)
                       .withOrderId(order_id);
    return result;
  }

  try {
    risk_->recordOrder(lifecycles_.getLifecycle(order_id).order);
  } catch (const ExecutionError& e) {
    logger_.error(kComponent, "failed to record order for rate limits",
                  {{"orderId", order_id}, {"error", e.message()}});
  }

  result.state = lifecycles_.getLifecycle(order_id).current_state;
  logger_.info(kComponent, "order submitted",
               {{"orderId", order_id},
                {"brokerOrderId", response.order_id},
                {"attempts", attempts},
                {"state", domain::toString(result.state)}});
  return result;
}

ExecutionEngine::PlacementGuard::PlacementGuard(ExecutionEngine& engine,
                                                domain::OrderId order_id)
    : engine_(engine), order_id_(std::move(order_id)) {
  std::lock_guard lock(engine_.placement_mutex_);
  engine_.placing_.insert(order_id_);
}

ExecutionEngine::PlacementGuard::~PlacementGuard() {
  std::lock_guard lock(engine_.placement_mutex_);
  engine_.placing_.erase(order_id_);
}

RouteResult<domain::BrokerOrderResponse> ExecutionEngine::placeAtVenue(
    const std::string& user_id, const domain::Order& order,
    const CallContext& ctx) {
  if (!order.client_id.empty()) {
    const auto own = router_->sessionClient(user_id);
    if (own && *own != order.client_id) {
      return router_->placeDealerOrder(user_id, order.client_id, order, ctx);
    }
  }
  return router_->placeOrder(user_id, order, ctx);
}

void ExecutionEngine::cancelStrayVenueOrder(const domain::OrderId& order_id,
                                            const std::string& user_id,
                                            const std::string& broker_order_id) {
  logger_.warn(kComponent, "venue accepted an order cancelled locally",
               {{"orderId", order_id}, {"brokerOrderId", broker_order_id}});
  auto routed = withRetry<domain::BrokerOrderResponse>(
      [&](const CallContext& ctx) {
        return router_->cancelOrder(user_id, broker_order_id, ctx);
      });
  if (!routed.ok()) {
    logger_.error(kComponent, "failed to cancel stray venue order",
                  {{"orderId", order_id},
                   {"brokerOrderId", broker_order_id},
                   {"error", routed.error->message()}});
  }
}

// -----------------------------------------------------------------------------
// Dependency hooks
// -----------------------------------------------------------------------------
void ExecutionEngine::onChildTriggered(const domain::OrderLifecycle& child) {
  const domain::OrderId child_id = child.order.id;
  worker_.post([this, child_id] {
    const SubmissionResult result = place(child_id, true);
    if (!result.accepted()) {
      logger_.warn(kComponent, "triggered child did not reach the venue",
                   {{"orderId", child_id},
                    {"state", domain::toString(result.state)},
                    {"error", result.error->message()}});
    }
  });
}

void ExecutionEngine::onOcoCancel(const domain::OrderId& child_id) {
  worker_.post([this, child_id] {
    try {
      cancelOrder(child_id);
    } catch (const ExecutionError& e) {
      logger_.warn(kComponent, "one-cancels-other cancel failed",
                   {{"orderId", child_id}, {"error", e.message()}});
    }
  });
}

// -----------------------------------------------------------------------------
// cancelOrder()
// -----------------------------------------------------------------------------
domain::OrderLifecycle ExecutionEngine::cancelOrder(
    const domain::OrderId& order_id) {
  const domain::OrderLifecycle lifecycle = lifecycles_.getLifecycle(order_id);
  const LifecycleState state = lifecycle.current_state;

  if (OrderLifecycleManager::isTerminal(state)) {
    throw ExecutionError::validation(
              ErrorCode::InvalidOrder,
              "Order " + order_id + " is already " + domain::toString(state),
              kComponent)
        .withOrderId(order_id);
  }
  if (state == LifecycleState::Cancelling) {
    throw ExecutionError::validation(
              ErrorCode::InvalidOrder,
              "Cancel already in progress for order " + order_id, kComponent)
        .withOrderId(order_id);
  }

  const std::string& broker_order_id = lifecycle.order.broker_order_id;
  if (!atVenue(state) || broker_order_id.empty()) {
    // A triggered child whose placement has not returned yet is caught by
    // place(), which cancels the venue order it gets back.
    return lifecycles_.transitionState(
        order_id, LifecycleState::Cancelled, "ORDER_CANCELLED",
        {{"reason", "cancelled before reaching the venue"}});
  }

  lifecycles_.transitionState(order_id, LifecycleState::Cancelling,
                              "CANCEL_REQUESTED",
                              {{"brokerOrderId", broker_order_id}});

  const auto context = contextFor(order_id);
  const std::string user_id = context ? context->user_id : std::string();
  auto routed = withRetry<domain::BrokerOrderResponse>(
      [&](const CallContext& ctx) {
        return router_->cancelOrder(user_id, broker_order_id, ctx);
      });

  if (!routed.ok()) {
    // The order stays in Cancelling; a later report or sync settles it.
    logger_.error(kComponent, "venue cancel failed",
                  {{"orderId", order_id},
                   {"brokerOrderId", broker_order_id},
                   {"error", routed.error->message()}});
    throw routed.error->withOrderId(order_id);
  }

  {
    std::lock_guard lock(reports_mutex_);
    const LifecycleState current =
        lifecycles_.getLifecycle(order_id).current_state;
    if (!OrderLifecycleManager::isTerminal(current)) {
      transitionQuietly(order_id, LifecycleState::Cancelled, "ORDER_CANCELLED",
                        {{"brokerOrderId", broker_order_id}});
    }
  }
  return lifecycles_.getLifecycle(order_id);
}

// -----------------------------------------------------------------------------
// modifyOrder()
// -----------------------------------------------------------------------------
domain::OrderLifecycle ExecutionEngine::modifyOrder(
    const domain::OrderId& order_id, std::optional<double> price,
    std::optional<std::int64_t> quantity, std::optional<double> trigger_price) {
  const auto check_state = [&order_id](LifecycleState state) {
    if (OrderLifecycleManager::isTerminal(state) ||
        state == LifecycleState::Cancelling) {
      throw ExecutionError::validation(
                ErrorCode::InvalidOrder,
                "Order " + order_id + " cannot be modified in state " +
                    domain::toString(state),
                kComponent)
          .withOrderId(order_id);
    }
  };

  domain::OrderLifecycle lifecycle = lifecycles_.getLifecycle(order_id);
  check_state(lifecycle.current_state);
  if (quantity && *quantity <= lifecycle.order.filled_quantity) {
    throw ExecutionError::validation(
              ErrorCode::InvalidParameter,
              "Quantity must exceed the filled quantity", kComponent)
        .withOrderId(order_id);
  }
  if ((price && *price < 0.0) || (trigger_price && *trigger_price < 0.0)) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "Prices must not be negative", kComponent)
        .withOrderId(order_id);
  }

  const auto apply = [&](domain::Order& o) {
    if (price) o.price = *price;
    if (quantity) o.quantity = *quantity;
    if (trigger_price) o.trigger_price = *trigger_price;
  };

  if (lifecycle.order.broker_order_id.empty()) {
    std::lock_guard lock(placement_mutex_);
    // Re-read under the lock: place() may have started or finished since.
    lifecycle = lifecycles_.getLifecycle(order_id);
    check_state(lifecycle.current_state);
    if (lifecycle.order.broker_order_id.empty()) {
      // A triggered child is Submitted before its placement is posted.
      if (placing_.count(order_id) != 0 || atVenue(lifecycle.current_state)) {
        throw ExecutionError::validation(
                  ErrorCode::InvalidOrder,
                  "Order " + order_id +
                      " is being placed and cannot be modified yet",
                  kComponent)
            .withOrderId(order_id);
      }
      return lifecycles_.updateOrder(order_id, apply);
    }
  }

  const std::string broker_order_id = lifecycle.order.broker_order_id;
  domain::OrderModification modification;
  modification.price = price;
  modification.quantity = quantity;
  modification.trigger_price = trigger_price;

  const auto context = contextFor(order_id);
  const std::string user_id = context ? context->user_id : std::string();
  auto routed = withRetry<domain::BrokerOrderResponse>(
      [&](const CallContext& ctx) {
        return router_->modifyOrder(user_id, broker_order_id, modification,
                                    ctx);
      });
  if (!routed.ok()) {
    throw routed.error->withOrderId(order_id);
  }

  logger_.info(kComponent, "order modified",
               {{"orderId", order_id}, {"brokerOrderId", broker_order_id}});
  return lifecycles_.updateOrder(order_id, apply);
}

// -----------------------------------------------------------------------------
// syncOrderStatus()
// -----------------------------------------------------------------------------
domain::OrderLifecycle ExecutionEngine::syncOrderStatus(
    const domain::OrderId& order_id) {
  const domain::OrderLifecycle lifecycle = lifecycles_.getLifecycle(order_id);
  const std::string& broker_order_id = lifecycle.order.broker_order_id;
  if (broker_order_id.empty()) {
    throw ExecutionError::validation(
              ErrorCode::InvalidOrder,
              "Order " + order_id + " has not reached the venue", kComponent)
        .withOrderId(order_id);
  }

  const auto context = contextFor(order_id);
  const std::string user_id = context ? context->user_id : std::string();
  auto routed = withRetry<domain::BrokerOrderDetails>(
      [&](const CallContext& ctx) {
        return router_->getOrderStatus(user_id, broker_order_id, ctx);
      });
  if (!routed.ok()) {
    throw routed.error->withOrderId(order_id);
  }

  const domain::BrokerOrderDetails& details = *routed.value;
  domain::ExecutionReport report;
  report.order_id = order_id;
  report.broker_order_id = broker_order_id;
  report.status = details.status;
  report.filled_quantity = details.filled_quantity;
  report.fill_price = details.average_price;
  report.message = details.status_message;
  report.timestamp_ms =
      details.updated_at_ms != 0 ? details.updated_at_ms : clock_.now_ms();
  onExecutionReport(report);

  return lifecycles_.getLifecycle(order_id);
}

// -----------------------------------------------------------------------------
// retryDeadLetter()
// -----------------------------------------------------------------------------
SubmissionResult ExecutionEngine::retryDeadLetter(
    const domain::OrderId& order_id) {
  const auto letter = dead_letters_.get(order_id);
  if (!letter) {
    throw ExecutionError::validation(
        ErrorCode::OrderNotFound,
        "Order not found in dead letter queue: " + order_id, kComponent);
  }
  const auto context = contextFor(order_id);
  if (!context) {
    throw ExecutionError::validation(
              ErrorCode::InvalidOrder,
              "No submission context for order " + order_id, kComponent)
        .withOrderId(order_id);
  }

  domain::Order retry = letter->order;
  retry.id = order_id + "-" + retry_ids_.next();
  retry.status = OrderStatus::New;
  retry.filled_quantity = 0;
  retry.average_price = 0.0;
  retry.broker_order_id.clear();
  retry.parent_order_id.reset();
  retry.created_at = ms_to_timestamp(clock_.now_ms());
  retry.updated_at = retry.created_at;

  dead_letters_.remove(order_id);
  logger_.info(kComponent, "retrying dead-lettered order",
               {{"orderId", order_id}, {"retryOrderId", retry.id}});

  return submitOrder(letter->user_id, retry, context->portfolio,
                     context->strategy);
}

// -----------------------------------------------------------------------------
// onExecutionReport()
// -----------------------------------------------------------------------------
void ExecutionEngine::onExecutionReport(const domain::ExecutionReport& report) {
  std::lock_guard lock(reports_mutex_);

  const auto order_id = resolveReportOrder(report);
  if (!order_id) {
    logger_.warn(kComponent, "execution report for unknown order",
                 {{"orderId", report.order_id},
                  {"brokerOrderId", report.broker_order_id},
                  {"status", domain::toString(report.status)}});
    return;
  }

  const LifecycleState state = lifecycles_.getLifecycle(*order_id).current_state;
  if (state == LifecycleState::Created || state == LifecycleState::Validated) {
    pending_reports_[*order_id].push_back(report);
    logger_.debug(kComponent, "buffered early execution report",
                  {{"orderId", *order_id},
                   {"status", domain::toString(report.status)}});
    return;
  }

  applyReportLocked(*order_id, report);
}

void ExecutionEngine::applyReportLocked(const domain::OrderId& order_id,
                                        const domain::ExecutionReport& report) {
  const domain::OrderLifecycle lifecycle = lifecycles_.getLifecycle(order_id);
  const LifecycleState state = lifecycle.current_state;
  if (OrderLifecycleManager::isTerminal(state)) {
    logger_.debug(kComponent, "report for terminal order ignored",
                  {{"orderId", order_id},
                   {"state", domain::toString(state)},
                   {"status", domain::toString(report.status)}});
    return;
  }

  nlohmann::json meta;
  meta["brokerOrderId"] = report.broker_order_id;
  meta["venueStatus"] = domain::toString(report.status);
  if (!report.message.empty()) {
    meta["message"] = report.message;
  }

  const auto acknowledgeIfSubmitted = [&] {
    if (lifecycles_.getLifecycle(order_id).current_state ==
        LifecycleState::Submitted) {
      transitionQuietly(order_id, LifecycleState::Acknowledged,
                        "ORDER_ACKNOWLEDGED", meta);
    }
  };

  switch (report.status) {
    case OrderStatus::New:
    case OrderStatus::Pending:
      return;

    case OrderStatus::Open:
      acknowledgeIfSubmitted();
      return;

    case OrderStatus::PartiallyFilled:
    case OrderStatus::Filled: {
      const std::int64_t delta =
          report.filled_quantity - lifecycle.order.filled_quantity;
      const bool complete = report.status == OrderStatus::Filled;
      if (delta < 0 || (delta == 0 && !complete)) {
        logger_.debug(kComponent, "stale fill report ignored",
                      {{"orderId", order_id},
                       {"reported", report.filled_quantity},
                       {"known", lifecycle.order.filled_quantity}});
        return;
      }

      acknowledgeIfSubmitted();

      const auto apply_fill = [&report](domain::Order& o) {
        o.filled_quantity = report.filled_quantity;
        o.average_price = report.fill_price;
      };
      meta["filledQuantity"] = report.filled_quantity;
      meta["fillPrice"] = report.fill_price;
      meta["lastQuantity"] = delta;

      bool applied = false;
      if (complete) {
        applied = transitionQuietly(order_id, LifecycleState::Completed,
                                    "ORDER_FILLED", meta, apply_fill);
      } else if (state == LifecycleState::Cancelling) {
        lifecycles_.updateOrder(order_id, apply_fill);
        applied = true;
      } else {
        applied = transitionQuietly(order_id, LifecycleState::PartiallyFilled,
                                    "ORDER_PARTIALLY_FILLED", meta, apply_fill);
      }

      if (applied && delta > 0) {
        const std::int64_t signed_delta =
            lifecycle.order.side == domain::Side::Buy ? delta : -delta;
        try {
          risk_->updatePosition(lifecycle.order.portfolio_id,
                                lifecycle.order.symbol, signed_delta);
        } catch (const ExecutionError& e) {
          logger_.error(kComponent, "position update failed",
                        {{"orderId", order_id}, {"error", e.message()}});
        }
      }
      return;
    }

    case OrderStatus::Cancelled:
      transitionQuietly(order_id, LifecycleState::Cancelled, "ORDER_CANCELLED",
                        meta);
      return;

    case OrderStatus::Rejected:
      transitionQuietly(order_id, LifecycleState::Rejected, "ORDER_REJECTED",
                        meta);
      return;

    case OrderStatus::Expired:
      acknowledgeIfSubmitted();
      transitionQuietly(order_id, LifecycleState::Expired, "ORDER_EXPIRED",
                        meta);
      return;

    case OrderStatus::Failed:
      transitionQuietly(order_id, LifecycleState::Failed, "ORDER_FAILED", meta);
      return;
  }
}

bool ExecutionEngine::transitionQuietly(
    const domain::OrderId& order_id, LifecycleState state,
    const std::string& event_type, const nlohmann::json& metadata,
    const OrderLifecycleManager::OrderUpdate& update) {
  try {
    lifecycles_.transitionState(order_id, state, event_type, metadata, update);
    return true;
  } catch (const ExecutionError& e) {
    logger_.debug(kComponent, "transition skipped",
                  {{"orderId", order_id},
                   {"target", domain::toString(state)},
                   {"event", event_type},
                   {"reason", e.message()}});
    return false;
  }
}

// -----------------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------------
std::optional<ExecutionEngine::OrderContext> ExecutionEngine::contextFor(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(contexts_mutex_);
  auto it = contexts_.find(order_id);
  if (it == contexts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::OrderId> ExecutionEngine::resolveReportOrder(
    const domain::ExecutionReport& report) const {
  if (!report.order_id.empty() && lifecycles_.hasLifecycle(report.order_id)) {
    return report.order_id;
  }
  if (report.broker_order_id.empty()) {
    return std::nullopt;
  }
  std::lock_guard lock(contexts_mutex_);
  auto it = broker_to_order_.find(report.broker_order_id);
  if (it == broker_to_order_.end()) {
    return std::nullopt;
  }
  return it->second;
}

CallContext ExecutionEngine::callContext() const {
  std::lock_guard lock(stop_mutex_);
  return CallContext::withTimeout(config_.engine.call_timeout, stop_token_);
}

bool ExecutionEngine::sleepUnlessStopped(std::chrono::milliseconds delay) {
  std::unique_lock lock(stop_mutex_);
  const auto token = stop_token_;
  return !stop_cv_.wait_for(lock, delay,
                            [&token] { return token->cancelled(); });
}

// -----------------------------------------------------------------------------
// Maintenance
// -----------------------------------------------------------------------------
std::vector<domain::OrderId> ExecutionEngine::sweepExpiredOrders() {
  std::vector<domain::OrderId> expired = lifecycles_.checkExpiredOrders();
  if (!expired.empty()) {
    logger_.info(kComponent, "expired orders swept",
                 {{"count", expired.size()}, {"orderIds", expired}});
  }
  return expired;
}

void ExecutionEngine::runMaintenance() {
  std::unique_lock lock(stop_mutex_);
  while (running_.load()) {
    stop_cv_.wait_for(lock, config_.engine.expiry_check_interval,
                      [this] { return !running_.load(); });
    if (!running_.load()) {
      break;
    }
    lock.unlock();
    sweepExpiredOrders();
    if (config_.monitoring.enabled) {
      monitor_.scan();
    }
    lock.lock();
  }
}

bool ExecutionEngine::waitForIdle(std::chrono::milliseconds timeout) {
  // Worker tasks can cause dependency work and the other way round.
  return dependencies_->waitForIdle(timeout) && worker_.waitIdle(timeout) &&
         dependencies_->waitForIdle(timeout);
}

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
void ExecutionEngine::setTelemetrySink(TelemetrySink sink) {
  std::lock_guard lock(telemetry_mutex_);
  telemetry_sink_ = std::move(sink);
}

void ExecutionEngine::publish(const domain::OrderLifecycle& lifecycle,
                              const domain::OrderEvent& event) {
  nlohmann::json message;
  message["type"] = "lifecycle";
  message["order_id"] = lifecycle.order.id;
  message["state"] = domain::toString(event.state);
  if (event.previous_state) {
    message["previous_state"] = domain::toString(*event.previous_state);
  }
  message["event_type"] = event.event_type;
  message["status"] = domain::toString(
      OrderLifecycleManager::toOrderStatus(lifecycle.current_state));
  message["filled_quantity"] = lifecycle.order.filled_quantity;
  message["timestamp_ms"] = timestamp_to_ms(event.timestamp);
  message["metadata"] = event.metadata;
  sendTelemetry(message);
}

void ExecutionEngine::publishAlert(const OrderAlert& alert) {
  nlohmann::json message = toJson(alert);
  message["alert_type"] = message["type"];
  message["type"] = "alert";
  sendTelemetry(message);
}

void ExecutionEngine::sendTelemetry(const nlohmann::json& message) {
  std::lock_guard lock(telemetry_mutex_);
  if (telemetry_sink_) {
    telemetry_sink_(message);
  }
}

// -----------------------------------------------------------------------------
// Control plane
// -----------------------------------------------------------------------------
nlohmann::json ExecutionEngine::executeCommand(const std::string& request) {
  try {
    nlohmann::json args = nlohmann::json::object();
    std::string command;

    const auto first = request.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && request[first] == '{') {
      args = nlohmann::json::parse(request);
      command = args.at("command").get<std::string>();
    } else {
      command = request;
      command.erase(0, command.find_first_not_of(" \t\r\n"));
      command.erase(command.find_last_not_of(" \t\r\n") + 1);
    }
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    nlohmann::json response;
    response["status"] = "ok";

    if (command == "PING") {
      response["response"] = "PONG";
    } else if (command == "STATUS") {
      response["data"] = statusJson();
    } else if (command == "BREAKERS") {
      nlohmann::json breakers = nlohmann::json::array();
      for (const auto& snap : breakers_.snapshot()) {
        nlohmann::json b;
        b["name"] = snap.name;
        b["state"] = toString(snap.state);
        b["failure_count"] = snap.failure_count;
        b["half_open_successes"] = snap.half_open_successes;
        b["last_failure_ms"] = snap.last_failure_ms;
        breakers.push_back(std::move(b));
      }
      response["data"] = std::move(breakers);
    } else if (command == "RESET_BREAKER") {
      const std::string name = args.at("name").get<std::string>();
      if (!breakers_.reset(name)) {
        return errorResponse("unknown breaker: " + name);
      }
    } else if (command == "DEAD_LETTERS") {
      nlohmann::json letters = nlohmann::json::array();
      for (const auto& letter : dead_letters_.list()) {
        letters.push_back(toJson(letter));
      }
      response["data"] = std::move(letters);
    } else if (command == "RETRY_DEAD_LETTER") {
      response["data"] =
          toJson(retryDeadLetter(args.at("order_id").get<std::string>()));
    } else if (command == "LIFECYCLE") {
      response["data"] =
          lifecycles_.getLifecycle(args.at("order_id").get<std::string>());
    } else if (command == "SUBMIT_ORDER") {
      const auto order = args.at("order").get<domain::Order>();
      const auto portfolio = args.at("portfolio").get<domain::Portfolio>();
      const auto strategy = args.at("strategy").get<domain::Strategy>();
      response["data"] = toJson(submitOrder(
          args.at("user_id").get<std::string>(), order, portfolio, strategy));
    } else if (command == "CANCEL_ORDER") {
      response["data"] =
          cancelOrder(args.at("order_id").get<std::string>());
    } else if (command == "SNAPSHOT") {
      response["data"] = snapshot();
    } else if (command == "ALERTS") {
      nlohmann::json alerts = nlohmann::json::array();
      for (const auto& alert : monitor_.activeAlerts()) {
        alerts.push_back(toJson(alert));
      }
      response["data"] = std::move(alerts);
    } else if (command == "ACK_ALERT") {
      const std::string order_id = args.at("order_id").get<std::string>();
      const std::string spelled = args.at("alert_type").get<std::string>();
      const auto type = parseAlertType(spelled);
      if (!type) {
        return errorResponse("unknown alert type: " + spelled);
      }
      monitor_.acknowledge(order_id, *type);
    } else {
      return errorResponse("Unknown command: " + command);
    }
    return response;
  } catch (const ExecutionError& e) {
    nlohmann::json response = errorResponse(e.message());
    response["details"] = e.toJson();
    return response;
  } catch (const nlohmann::json::exception& e) {
    logger_.warn(kComponent, "malformed control request",
                 {{"reason", e.what()}});
    return errorResponse(std::string("malformed request: ") + e.what());
  }
}

nlohmann::json ExecutionEngine::statusJson() const {
  std::map<std::string, int> by_state;
  std::size_t active = 0;
  const auto all = lifecycles_.getAllLifecycles();
  for (const auto& lifecycle : all) {
    ++by_state[domain::toString(lifecycle.current_state)];
    if (!OrderLifecycleManager::isTerminal(lifecycle.current_state)) {
      ++active;
    }
  }

  int open_breakers = 0;
  for (const auto& snap : breakers_.snapshot()) {
    if (snap.state != CircuitState::Closed) {
      ++open_breakers;
    }
  }

  nlohmann::json j;
  j["running"] = running_.load();
  j["lifecycles"] = all.size();
  j["active"] = active;
  j["by_state"] = by_state;
  j["dead_letters"] = dead_letters_.size();
  j["clients"] = router_->registeredClients();
  j["breakers_not_closed"] = open_breakers;
  return j;
}

nlohmann::json ExecutionEngine::snapshot() const {
  nlohmann::json j;
  j["taken_at_ms"] = clock_.now_ms();
  j["lifecycles"] = lifecycles_.getAllLifecycles();
  j["dependencies"] = dependencies_->allDependencies();
  j["risk_profiles"] = risk_->listRiskProfiles();

  nlohmann::json letters = nlohmann::json::array();
  for (const auto& letter : dead_letters_.list()) {
    letters.push_back(toJson(letter));
  }
  j["dead_letters"] = std::move(letters);
  return j;
}

}  // namespace orex

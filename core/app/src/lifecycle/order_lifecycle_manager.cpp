#include "orex/lifecycle/order_lifecycle_manager.hpp"

#include "orex/errors/execution_error.hpp"

#include <algorithm>
#include <utility>

namespace orex {

using domain::LifecycleState;
using domain::OrderEvent;
using domain::OrderLifecycle;
using domain::OrderStatus;

namespace {

constexpr const char* kEventOrderCreated = "ORDER_CREATED";
constexpr const char* kEventOrderExpired = "ORDER_EXPIRED";

ExecutionError notFound(const domain::OrderId& order_id) {
  return ExecutionError::validation(
             ErrorCode::OrderNotFound,
             "Order lifecycle not found for order ID " + order_id,
             OrderLifecycleManager::kComponent)
      .withOrderId(order_id);
}

bool byOrderId(const OrderLifecycle& a, const OrderLifecycle& b) {
  return a.order.id < b.order.id;
}

}  // namespace

OrderLifecycleManager::OrderLifecycleManager(const ITimeProvider& clock,
                                             ILogger& logger)
    : clock_(clock), logger_(logger) {}

Timestamp OrderLifecycleManager::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

// -----------------------------------------------------------------------------
// Transition table
// -----------------------------------------------------------------------------
bool OrderLifecycleManager::isValidTransition(LifecycleState from,
                                              LifecycleState to) {
  using S = LifecycleState;
  switch (from) {
    case S::Created:
      return to == S::Validated || to == S::Cancelled || to == S::Rejected ||
             to == S::Failed;
    case S::Validated:
      return to == S::Submitted || to == S::Cancelled || to == S::Rejected ||
             to == S::Failed;
    case S::Submitted:
      return to == S::Acknowledged || to == S::Cancelling ||
             to == S::Cancelled || to == S::Rejected || to == S::Failed;
    case S::Acknowledged:
    case S::PartiallyFilled:
      return to == S::PartiallyFilled || to == S::Completed ||
             to == S::Cancelling || to == S::Cancelled ||
             to == S::Rejected || to == S::Failed || to == S::Expired;
    case S::Cancelling:
      return to == S::Completed || to == S::Cancelled || to == S::Rejected ||
             to == S::Failed;
    case S::Completed:
    case S::Cancelled:
    case S::Rejected:
    case S::Expired:
    case S::Failed:
      return false;
  }
  return false;
}

bool OrderLifecycleManager::isTerminal(LifecycleState state) {
  switch (state) {
    case LifecycleState::Completed:
    case LifecycleState::Cancelled:
    case LifecycleState::Rejected:
    case LifecycleState::Expired:
    case LifecycleState::Failed:
      return true;
    default:
      return false;
  }
}

OrderStatus OrderLifecycleManager::toOrderStatus(LifecycleState state) {
  using S = LifecycleState;
  switch (state) {
    case S::Created:         return OrderStatus::New;
    case S::Validated:       return OrderStatus::New;
    case S::Submitted:       return OrderStatus::Pending;
    case S::Cancelling:      return OrderStatus::Pending;
    case S::Acknowledged:    return OrderStatus::Open;
    case S::PartiallyFilled: return OrderStatus::PartiallyFilled;
    case S::Completed:       return OrderStatus::Filled;
    case S::Cancelled:       return OrderStatus::Cancelled;
    case S::Rejected:        return OrderStatus::Rejected;
    case S::Expired:         return OrderStatus::Expired;
    case S::Failed:          return OrderStatus::Failed;
  }
  return OrderStatus::New;
}

// -----------------------------------------------------------------------------
// createLifecycle()
// -----------------------------------------------------------------------------
OrderLifecycle OrderLifecycleManager::createLifecycle(
    const domain::Order& order) {
  if (order.id.empty()) {
    throw ExecutionError::validation(ErrorCode::InvalidOrder,
                                     "order ID is required", kComponent);
  }

  const Timestamp ts = now();

  auto entry = std::make_shared<Entry>();
  OrderLifecycle& lc = entry->lifecycle;
  lc.order = order;
  lc.order.status = OrderStatus::New;
  lc.order.created_at = ts;
  lc.order.updated_at = ts;
  lc.current_state = LifecycleState::Created;
  lc.created_at = ts;
  lc.updated_at = ts;

  OrderEvent created;
  created.id = event_ids_.next();
  created.order_id = order.id;
  created.state = LifecycleState::Created;
  created.event_type = kEventOrderCreated;
  created.timestamp = ts;
  lc.events.push_back(std::move(created));

  {
    std::unique_lock lock(map_mutex_);
    if (lifecycles_.count(order.id) != 0) {
      throw ExecutionError::validation(
                ErrorCode::InvalidOrder,
                "Order lifecycle already exists for order ID " + order.id,
                kComponent)
          .withOrderId(order.id);
    }
    lifecycles_.emplace(order.id, entry);
  }

  logger_.debug(kComponent, "lifecycle created",
                {{"orderId", order.id}, {"symbol", order.symbol}});
  return lc;
}

std::shared_ptr<OrderLifecycleManager::Entry> OrderLifecycleManager::findEntry(
    const domain::OrderId& order_id) const {
  std::shared_lock lock(map_mutex_);
  auto it = lifecycles_.find(order_id);
  return it == lifecycles_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<OrderLifecycleManager::Entry>>
OrderLifecycleManager::allEntries() const {
  std::shared_lock lock(map_mutex_);
  std::vector<std::shared_ptr<Entry>> out;
  out.reserve(lifecycles_.size());
  for (const auto& [id, entry] : lifecycles_) {
    out.push_back(entry);
  }
  return out;
}

OrderLifecycle OrderLifecycleManager::getLifecycle(
    const domain::OrderId& order_id) const {
  auto entry = findEntry(order_id);
  if (!entry) {
    throw notFound(order_id);
  }
  std::lock_guard lock(entry->mutex);
  return entry->lifecycle;
}

bool OrderLifecycleManager::hasLifecycle(
    const domain::OrderId& order_id) const {
  return findEntry(order_id) != nullptr;
}

// -----------------------------------------------------------------------------
// transitionState(): validate under the entry lock, notify after release
// -----------------------------------------------------------------------------
OrderLifecycle OrderLifecycleManager::transitionState(
    const domain::OrderId& order_id, LifecycleState new_state,
    const std::string& event_type, const nlohmann::json& metadata,
    const OrderUpdate& update) {
  auto entry = findEntry(order_id);
  if (!entry) {
    throw notFound(order_id);
  }

  OrderLifecycle snapshot;
  OrderEvent event;
  {
    std::lock_guard lock(entry->mutex);
    OrderLifecycle& lc = entry->lifecycle;
    const LifecycleState from = lc.current_state;

    if (!isValidTransition(from, new_state)) {
      throw ExecutionError::validation(
                ErrorCode::InvalidOrder,
                std::string("Invalid state transition from ") +
                    domain::toString(from) + " to " +
                    domain::toString(new_state),
                kComponent)
          .withOrderId(order_id)
          .withDetails({{"from", domain::toString(from)},
                        {"to", domain::toString(new_state)},
                        {"eventType", event_type}});
    }

    // A throwing update leaves the lifecycle as it was.
    domain::Order order = lc.order;
    if (update) {
      update(order);
    }

    const Timestamp ts = now();
    lc.order = std::move(order);
    lc.current_state = new_state;
    lc.order.status = toOrderStatus(new_state);
    lc.order.updated_at = ts;
    lc.updated_at = ts;

    event.id = event_ids_.next();
    event.order_id = order_id;
    event.previous_state = from;
    event.state = new_state;
    event.event_type = event_type;
    event.timestamp = ts;
    event.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    lc.events.push_back(event);

    snapshot = lc;
  }

  logger_.debug(kComponent, "state transition",
                {{"orderId", order_id},
                 {"from", domain::toString(*event.previous_state)},
                 {"to", domain::toString(new_state)},
                 {"eventType", event_type}});

  notify(snapshot, event);
  return snapshot;
}

OrderLifecycle OrderLifecycleManager::updateOrder(
    const domain::OrderId& order_id, const OrderUpdate& update) {
  auto entry = findEntry(order_id);
  if (!entry) {
    throw notFound(order_id);
  }
  std::lock_guard lock(entry->mutex);
  OrderLifecycle& lc = entry->lifecycle;
  domain::Order order = lc.order;
  if (update) {
    update(order);
  }
  lc.order = std::move(order);
  const Timestamp ts = now();
  lc.order.updated_at = ts;
  lc.updated_at = ts;
  return lc;
}

// -----------------------------------------------------------------------------
// Callback registry
// -----------------------------------------------------------------------------
OrderLifecycleManager::CallbackId OrderLifecycleManager::registerCallback(
    LifecycleState state, Callback callback) {
  std::lock_guard lock(callbacks_mutex_);
  const CallbackId id = next_callback_id_++;
  callbacks_.push_back(Registration{id, state, std::move(callback)});
  return id;
}

bool OrderLifecycleManager::unregisterCallback(CallbackId id) {
  std::unique_lock lock(callbacks_mutex_);
  auto it = std::remove_if(callbacks_.begin(), callbacks_.end(),
                           [id](const Registration& r) { return r.id == id; });
  const bool found = it != callbacks_.end();
  callbacks_.erase(it, callbacks_.end());

  callbacks_cv_.wait(lock, [this, id] { return in_flight_.count(id) == 0; });
  return found;
}

bool OrderLifecycleManager::beginInvocation(CallbackId id) {
  std::lock_guard lock(callbacks_mutex_);
  const bool registered =
      std::any_of(callbacks_.begin(), callbacks_.end(),
                  [id](const Registration& r) { return r.id == id; });
  if (registered) {
    ++in_flight_[id];
  }
  return registered;
}

void OrderLifecycleManager::finishInvocation(CallbackId id) {
  std::lock_guard lock(callbacks_mutex_);
  auto it = in_flight_.find(id);
  if (it != in_flight_.end() && --it->second == 0) {
    in_flight_.erase(it);
    callbacks_cv_.notify_all();
  }
}

// -----------------------------------------------------------------------------
// notify(): each invocation is counted so unregisterCallback() can wait
// -----------------------------------------------------------------------------
void OrderLifecycleManager::notify(const OrderLifecycle& lifecycle,
                                   const OrderEvent& event) {
  std::vector<Registration> copy;
  {
    std::lock_guard lock(callbacks_mutex_);
    for (const auto& reg : callbacks_) {
      if (reg.state == event.state) {
        copy.push_back(reg);
      }
    }
  }

  for (const auto& reg : copy) {
    if (!beginInvocation(reg.id)) {
      continue;
    }
    InvocationGuard guard(*this, reg.id);
    try {
      reg.callback(lifecycle, event);
    } catch (const std::exception& e) {
      logger_.error(kComponent, "lifecycle callback threw",
                    {{"orderId", event.order_id},
                     {"state", domain::toString(event.state)},
                     {"callbackId", reg.id},
                     {"error", e.what()}});
    }
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<OrderEvent> OrderLifecycleManager::getOrderEvents(
    const domain::OrderId& order_id) const {
  auto entry = findEntry(order_id);
  if (!entry) {
    throw notFound(order_id);
  }
  std::lock_guard lock(entry->mutex);
  return entry->lifecycle.events;
}

std::vector<OrderLifecycle> OrderLifecycleManager::getActiveLifecycles() const {
  std::vector<OrderLifecycle> out;
  for (const auto& entry : allEntries()) {
    std::lock_guard lock(entry->mutex);
    if (!isTerminal(entry->lifecycle.current_state)) {
      out.push_back(entry->lifecycle);
    }
  }
  std::sort(out.begin(), out.end(), byOrderId);
  return out;
}

std::vector<OrderLifecycle> OrderLifecycleManager::getAllLifecycles() const {
  std::vector<OrderLifecycle> out;
  for (const auto& entry : allEntries()) {
    std::lock_guard lock(entry->mutex);
    out.push_back(entry->lifecycle);
  }
  std::sort(out.begin(), out.end(), byOrderId);
  return out;
}

std::size_t OrderLifecycleManager::size() const {
  std::shared_lock lock(map_mutex_);
  return lifecycles_.size();
}

// -----------------------------------------------------------------------------
// checkExpiredOrders(): scan, then transition each candidate
// -----------------------------------------------------------------------------
std::vector<domain::OrderId> OrderLifecycleManager::checkExpiredOrders() {
  const Timestamp ts = now();

  std::vector<std::pair<domain::OrderId, Timestamp>> candidates;
  for (const auto& entry : allEntries()) {
    std::lock_guard lock(entry->mutex);
    const OrderLifecycle& lc = entry->lifecycle;
    const bool working = lc.current_state == LifecycleState::Acknowledged ||
                         lc.current_state == LifecycleState::PartiallyFilled;
    if (working && lc.order.validity == domain::Validity::GTD &&
        lc.order.expires_at && *lc.order.expires_at <= ts) {
      candidates.emplace_back(lc.order.id, *lc.order.expires_at);
    }
  }

  std::vector<domain::OrderId> expired;
  for (const auto& [order_id, expires_at] : candidates) {
    try {
      transitionState(order_id, LifecycleState::Expired, kEventOrderExpired,
                      {{"expiresAtMs", timestamp_to_ms(expires_at)}});
      expired.push_back(order_id);
    } catch (const ExecutionError& e) {
      logger_.debug(kComponent, "expiry skipped, order moved on",
                    {{"orderId", order_id}, {"reason", e.message()}});
    }
  }

  if (!expired.empty()) {
    logger_.info(kComponent, "orders expired",
                 {{"count", expired.size()}});
  }
  std::sort(expired.begin(), expired.end());
  return expired;
}

}  // namespace orex

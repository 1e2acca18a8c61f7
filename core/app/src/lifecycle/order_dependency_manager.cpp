#include "orex/lifecycle/order_dependency_manager.hpp"

#include "orex/errors/execution_error.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace orex {

using domain::DependencyType;
using domain::LifecycleState;
using domain::OrderDependency;

namespace {

ExecutionError invalidParameter(std::string message) {
  return ExecutionError::validation(ErrorCode::InvalidParameter,
                                    std::move(message),
                                    OrderDependencyManager::kComponent);
}

// Upper bound on the trigger work stop() lets finish before joining.
constexpr auto kStopDrainTimeout = std::chrono::milliseconds(5'000);

}  // namespace

OrderDependencyManager::OrderDependencyManager(
    OrderLifecycleManager& lifecycles, IErrorHandler& errors,
    const ITimeProvider& clock, ILogger& logger)
    : lifecycles_(lifecycles), errors_(errors), clock_(clock), logger_(logger) {
  start();
}

OrderDependencyManager::~OrderDependencyManager() { stop(); }

// -----------------------------------------------------------------------------
// start(): start the worker, then subscribe to terminal states
// -----------------------------------------------------------------------------
void OrderDependencyManager::start() {
  worker_.start();
  if (!subscriptions_.empty()) {
    return;
  }

  subscriptions_.push_back(lifecycles_.registerCallback(
      LifecycleState::Completed,
      [this](const domain::OrderLifecycle& lc, const domain::OrderEvent&) {
        const domain::OrderId parent_id = lc.order.id;
        worker_.post([this, parent_id] { onParentCompleted(parent_id); });
      }));

  for (LifecycleState state :
       {LifecycleState::Cancelled, LifecycleState::Rejected,
        LifecycleState::Failed, LifecycleState::Expired}) {
    subscriptions_.push_back(lifecycles_.registerCallback(
        state,
        [this](const domain::OrderLifecycle& lc, const domain::OrderEvent& e) {
          const domain::OrderId parent_id = lc.order.id;
          const LifecycleState parent_state = e.state;
          worker_.post([this, parent_id, parent_state] {
            onParentTerminated(parent_id, parent_state);
          });
        }));
  }
}

// -----------------------------------------------------------------------------
// stop(): no new work can arrive once unsubscribed; drain, then join
// -----------------------------------------------------------------------------
void OrderDependencyManager::stop() {
  for (auto id : subscriptions_) {
    lifecycles_.unregisterCallback(id);
  }
  subscriptions_.clear();

  if (!worker_.waitIdle(kStopDrainTimeout)) {
    logger_.warn(kComponent, "trigger work still pending at stop",
                 {{"timeoutMs", kStopDrainTimeout.count()}});
  }
  worker_.stop();
}

void OrderDependencyManager::setHooks(Hooks hooks) {
  std::lock_guard lock(mutex_);
  hooks_ = std::move(hooks);
}

// -----------------------------------------------------------------------------
// createDependency()
// -----------------------------------------------------------------------------
OrderDependency OrderDependencyManager::createDependency(
    const domain::OrderId& parent_id, const domain::OrderId& child_id,
    DependencyType type, const std::string& condition) {
  if (!lifecycles_.hasLifecycle(parent_id)) {
    throw invalidParameter("Parent order not found: " + parent_id);
  }
  if (!lifecycles_.hasLifecycle(child_id)) {
    throw invalidParameter("Child order not found: " + child_id);
  }

  std::lock_guard lock(mutex_);

  for (const auto& dep : dependencies_) {
    if (dep.parent_order_id == parent_id && dep.child_order_id == child_id) {
      throw invalidParameter("Dependency already exists between parent " +
                             parent_id + " and child " + child_id);
    }
  }

  // Each order has at most one parent, so walking up from the new parent
  // visits every ancestor. Reaching the child means the edge closes a loop.
  for (domain::OrderId cursor = parent_id;;) {
    if (cursor == child_id) {
      throw invalidParameter("Dependency would create a cycle between parent " +
                             parent_id + " and child " + child_id);
    }
    auto up = parent_of_.find(cursor);
    if (up == parent_of_.end()) {
      break;
    }
    cursor = up->second;
  }

  auto existing = parent_of_.find(child_id);
  if (existing != parent_of_.end()) {
    throw invalidParameter("Child order " + child_id + " already has parent " +
                           existing->second);
  }

  OrderDependency dep;
  dep.id = dependency_ids_.next();
  dep.parent_order_id = parent_id;
  dep.child_order_id = child_id;
  dep.type = type;
  dep.condition = condition;
  dep.created_at = ms_to_timestamp(clock_.now_ms());

  dependencies_.push_back(dep);
  parent_of_.emplace(child_id, parent_id);

  logger_.info(kComponent, "dependency created",
               {{"dependencyId", dep.id},
                {"parentOrderId", parent_id},
                {"childOrderId", child_id},
                {"type", domain::toString(type)}});
  return dep;
}

std::vector<OrderDependency> OrderDependencyManager::getDependencies(
    const domain::OrderId& parent_id) const {
  std::lock_guard lock(mutex_);
  std::vector<OrderDependency> out;
  for (const auto& dep : dependencies_) {
    if (dep.parent_order_id == parent_id) {
      out.push_back(dep);
    }
  }
  return out;
}

domain::OrderId OrderDependencyManager::getParentOrder(
    const domain::OrderId& child_id) const {
  std::lock_guard lock(mutex_);
  auto it = parent_of_.find(child_id);
  if (it == parent_of_.end()) {
    throw ExecutionError::validation(
              ErrorCode::OrderNotFound,
              "No parent order found for child order " + child_id,
              kComponent)
        .withOrderId(child_id);
  }
  return it->second;
}

void OrderDependencyManager::deleteDependency(
    const std::string& dependency_id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(
      dependencies_.begin(), dependencies_.end(),
      [&](const OrderDependency& d) { return d.id == dependency_id; });
  if (it == dependencies_.end()) {
    throw invalidParameter("Dependency not found: " + dependency_id);
  }
  parent_of_.erase(it->child_order_id);
  dependencies_.erase(it);

  logger_.info(kComponent, "dependency deleted",
               {{"dependencyId", dependency_id}});
}

std::vector<OrderDependency> OrderDependencyManager::allDependencies() const {
  std::lock_guard lock(mutex_);
  return dependencies_;
}

bool OrderDependencyManager::waitForIdle(std::chrono::milliseconds timeout) {
  return worker_.waitIdle(timeout);
}

bool OrderDependencyManager::markTriggered(const std::string& dependency_id) {
  std::lock_guard lock(mutex_);
  return triggered_.insert(dependency_id).second;
}

// -----------------------------------------------------------------------------
// onParentCompleted(): OTO children advance, OCO children cancel
// -----------------------------------------------------------------------------
void OrderDependencyManager::onParentCompleted(
    const domain::OrderId& parent_id) {
  for (const auto& dep : getDependencies(parent_id)) {
    if (!markTriggered(dep.id)) {
      continue;
    }
    if (dep.type == DependencyType::OneTriggersOther) {
      triggerChild(dep);
    } else {
      cancelChild(dep, kEventParentCompleted, true);
    }
  }
}

// -----------------------------------------------------------------------------
// onParentTerminated(): OTO children that never reached the venue are
// cancelled. OCO edges only react to completion.
// -----------------------------------------------------------------------------
void OrderDependencyManager::onParentTerminated(
    const domain::OrderId& parent_id, LifecycleState parent_state) {
  for (const auto& dep : getDependencies(parent_id)) {
    if (dep.type != DependencyType::OneTriggersOther) {
      continue;
    }
    if (!markTriggered(dep.id)) {
      continue;
    }
    logger_.info(kComponent, "parent terminated, cancelling child",
                 {{"dependencyId", dep.id},
                  {"parentOrderId", parent_id},
                  {"parentState", domain::toString(parent_state)},
                  {"childOrderId", dep.child_order_id}});
    cancelChild(dep, kEventParentTerminated, false);
  }
}

// -----------------------------------------------------------------------------
// triggerChild(): walk the legal chain up to Submitted
// -----------------------------------------------------------------------------
void OrderDependencyManager::triggerChild(const OrderDependency& dep) {
  const domain::OrderId& child_id = dep.child_order_id;
  const nlohmann::json metadata = {{"parentOrderId", dep.parent_order_id},
                                   {"dependencyId", dep.id}};
  try {
    domain::OrderLifecycle child = lifecycles_.getLifecycle(child_id);

    if (child.current_state != LifecycleState::Created &&
        child.current_state != LifecycleState::Validated) {
      if (OrderLifecycleManager::isTerminal(child.current_state) &&
          child.current_state != LifecycleState::Completed) {
        throw ExecutionError::validation(
                  ErrorCode::InvalidOrder,
                  "Child order " + child_id + " cannot be triggered from state " +
                      domain::toString(child.current_state),
                  kComponent)
            .withOrderId(child_id);
      }
      logger_.debug(kComponent, "child already submitted, skipping",
                    {{"dependencyId", dep.id},
                     {"childOrderId", child_id},
                     {"state", domain::toString(child.current_state)}});
      return;
    }

    if (child.current_state == LifecycleState::Created) {
      lifecycles_.transitionState(child_id, LifecycleState::Validated,
                                  kEventParentCompleted, metadata);
    }
    child = lifecycles_.transitionState(child_id, LifecycleState::Submitted,
                                        kEventParentCompleted, metadata);

    logger_.info(kComponent, "child order triggered",
                 {{"dependencyId", dep.id},
                  {"parentOrderId", dep.parent_order_id},
                  {"childOrderId", child_id}});

    std::function<void(const domain::OrderLifecycle&)> hook;
    {
      std::lock_guard lock(mutex_);
      hook = hooks_.on_child_triggered;
    }
    if (hook) {
      hook(child);
    }
  } catch (const ExecutionError& e) {
    reportFailure(dep, e);
  }
}

// -----------------------------------------------------------------------------
// cancelChild()
// -----------------------------------------------------------------------------
void OrderDependencyManager::cancelChild(const OrderDependency& dep,
                                         const char* event_type,
                                         bool venue_cancel_allowed) {
  const domain::OrderId& child_id = dep.child_order_id;
  try {
    const domain::OrderLifecycle child = lifecycles_.getLifecycle(child_id);
    const LifecycleState state = child.current_state;

    if (OrderLifecycleManager::isTerminal(state)) {
      return;
    }

    const bool at_venue =
        state != LifecycleState::Created && state != LifecycleState::Validated;
    if (at_venue && !venue_cancel_allowed) {
      return;
    }

    std::function<void(const domain::OrderId&)> hook;
    {
      std::lock_guard lock(mutex_);
      hook = hooks_.cancel_child;
    }

    if (at_venue && hook) {
      hook(child_id);
    } else {
      lifecycles_.transitionState(
          child_id, LifecycleState::Cancelled, event_type,
          {{"parentOrderId", dep.parent_order_id}, {"dependencyId", dep.id}});
    }

    logger_.info(kComponent, "child order cancelled",
                 {{"dependencyId", dep.id},
                  {"type", domain::toString(dep.type)},
                  {"childOrderId", child_id}});
  } catch (const ExecutionError& e) {
    reportFailure(dep, e);
  }
}

void OrderDependencyManager::reportFailure(const OrderDependency& dep,
                                           const ExecutionError& error) {
  const std::string context = "dependency:" + dep.id;
  RetryDecision decision = errors_.handleError(context, error);
  errors_.releaseContext(context);

  logger_.error(kComponent, "dependency trigger failed",
                {{"dependencyId", dep.id},
                 {"parentOrderId", dep.parent_order_id},
                 {"childOrderId", dep.child_order_id},
                 {"code", toString(decision.reported.code())},
                 {"error", decision.reported.message()}});
}

}  // namespace orex

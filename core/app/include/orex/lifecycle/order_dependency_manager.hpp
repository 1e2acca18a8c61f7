#pragma once

#include "orex/concurrent/sequence_generator.hpp"
#include "orex/concurrent/task_loop_thread.hpp"
#include "orex/domain/order_dependency.hpp"
#include "orex/errors/error_handler.hpp"
#include "orex/lifecycle/order_lifecycle_manager.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// OrderDependencyManager — parent → child order links
// -----------------------------------------------------------------------------
//
// @brief  Records directed dependencies between orders and reacts to the
//         parent's terminal state:
//
//   parent Completed                  OTO child  → Validated → Submitted
//                                     OCO child  → Cancelled
//   parent Cancelled/Rejected/
//          Failed/Expired             OTO child still in Created/Validated
//                                                → Cancelled
//
// @details
// The manager subscribes to the lifecycle manager's terminal-state
// callbacks at construction. A callback only posts work to the manager's
// own TaskLoopThread; triggering never runs inside the parent's
// transition, so the parent's caller is not blocked by child routing and
// lifecycle locks are never nested.
//
// Triggering is idempotent: each dependency fires at most once, and a
// child already at or past Submitted is left alone. A child that is in a
// terminal state cannot be triggered; that failure is reported through the
// error handler under the context "dependency:<id>" and logged.
//
// Graph invariants enforced by createDependency():
//   - both orders have lifecycles
//   - no duplicate (parent, child) edge
//   - no cycle, including parent == child
//   - a child has at most one parent
//
// Thread model:
//   Public methods are thread-safe. Trigger work runs on the
//   "dependency_loop" worker thread; hooks are invoked there.
//
// Ownership:
//   Holds references to the lifecycle manager and error handler, which
//   must outlive it. The destructor calls stop().
// -----------------------------------------------------------------------------
class OrderDependencyManager {
 public:
  static constexpr const char* kComponent = "OrderDependencyManager";
  static constexpr const char* kEventParentCompleted = "PARENT_COMPLETED";
  static constexpr const char* kEventParentTerminated = "PARENT_TERMINATED";

  // Optional integration points, invoked on the worker thread.
  struct Hooks {
    // Child has just reached Submitted through an OTO trigger and should
    // now be placed at the venue.
    std::function<void(const domain::OrderLifecycle& child)> on_child_triggered;

    // Child is already at the venue and must be cancelled there. When
    // unset, the child is moved to Cancelled locally.
    std::function<void(const domain::OrderId& child_id)> cancel_child;
  };

  OrderDependencyManager(OrderLifecycleManager& lifecycles,
                         IErrorHandler& errors, const ITimeProvider& clock,
                         ILogger& logger);
  ~OrderDependencyManager();

  OrderDependencyManager(const OrderDependencyManager&) = delete;
  OrderDependencyManager& operator=(const OrderDependencyManager&) = delete;

  void setHooks(Hooks hooks);

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start(): subscribes to the terminal-state callbacks and starts the
  // worker. The constructor calls it.
  //
  // stop(): unsubscribes (waiting out callbacks already running), lets the
  // worker finish the trigger work already posted, then joins it. No hook
  // runs once stop() has returned.
  //
  // Both idempotent. Call from one thread.
  // -------------------------------------------------------------------------
  void start();
  void stop();

  // -------------------------------------------------------------------------
  // createDependency(parent_id, child_id, type, condition)
  // -------------------------------------------------------------------------
  // @throws ExecutionError Validation/InvalidParameter:
  //   "Parent order not found: <id>"
  //   "Child order not found: <id>"
  //   "Dependency already exists between parent <p> and child <c>"
  //   "Dependency would create a cycle between parent <p> and child <c>"
  //   "Child order <c> already has parent <p>"
  // -------------------------------------------------------------------------
  domain::OrderDependency createDependency(const domain::OrderId& parent_id,
                                           const domain::OrderId& child_id,
                                           domain::DependencyType type,
                                           const std::string& condition = "");

  // Insertion order. Empty if the parent has no dependents.
  std::vector<domain::OrderDependency> getDependencies(
      const domain::OrderId& parent_id) const;

  // @throws ExecutionError Validation/OrderNotFound if the child has no
  //         parent.
  domain::OrderId getParentOrder(const domain::OrderId& child_id) const;

  // @throws ExecutionError Validation/InvalidParameter if `dependency_id`
  //         is unknown.
  void deleteDependency(const std::string& dependency_id);

  std::vector<domain::OrderDependency> allDependencies() const;

  // Trigger handlers. Called from the worker; public so tests can drive
  // them directly and check idempotence.
  void onParentCompleted(const domain::OrderId& parent_id);
  void onParentTerminated(const domain::OrderId& parent_id,
                          domain::LifecycleState parent_state);

  // Blocks until all posted trigger work has run.
  // @return false on timeout.
  bool waitForIdle(std::chrono::milliseconds timeout =
                       std::chrono::milliseconds(5000));

 private:
  void triggerChild(const domain::OrderDependency& dep);
  void cancelChild(const domain::OrderDependency& dep, const char* event_type,
                   bool venue_cancel_allowed);
  void reportFailure(const domain::OrderDependency& dep,
                     const ExecutionError& error);

  // Marks `dependency_id` as fired. @return false if it already was.
  bool markTriggered(const std::string& dependency_id);

  OrderLifecycleManager& lifecycles_;
  IErrorHandler& errors_;
  const ITimeProvider& clock_;
  ILogger& logger_;
  SequenceGenerator dependency_ids_{"dep"};

  mutable std::mutex mutex_;
  std::vector<domain::OrderDependency> dependencies_;
  std::unordered_map<domain::OrderId, domain::OrderId> parent_of_;
  std::unordered_set<std::string> triggered_;
  Hooks hooks_;

  std::vector<OrderLifecycleManager::CallbackId> subscriptions_;
  TaskLoopThread worker_{"dependency_loop"};
};

}  // namespace orex

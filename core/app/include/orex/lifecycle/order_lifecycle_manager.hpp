#pragma once

#include "orex/concurrent/sequence_generator.hpp"
#include "orex/domain/order.hpp"
#include "orex/domain/order_lifecycle.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// OrderLifecycleManager — authoritative order state machine
// -----------------------------------------------------------------------------
//
// @brief  Owns one OrderLifecycle per order ID, validates every state change
//         against a fixed transition table, records an append-only event
//         history, and notifies per-state subscribers.
//
// @details
// Transition table (from → legal targets):
//
//   Created         → Validated, Cancelled, Rejected, Failed
//   Validated       → Submitted, Cancelled, Rejected, Failed
//   Submitted       → Acknowledged, Cancelling, Cancelled, Rejected, Failed
//   Acknowledged    → PartiallyFilled, Completed, Cancelling, Cancelled,
//                     Rejected, Failed, Expired
//   PartiallyFilled → PartiallyFilled, Completed, Cancelling, Cancelled,
//                     Rejected, Failed, Expired
//   Cancelling      → Completed, Cancelled, Rejected, Failed
//   terminal        → (none)
//
// An illegal request is reported (Validation/InvalidOrder) and the
// lifecycle is left untouched. Requests are never coerced into the nearest
// legal state.
//
// Callbacks:
//   Registered per target state and invoked in registration order with the
//   post-transition snapshot and the new event. They run on the thread that
//   called transitionState(), AFTER every lock is released, so a callback
//   may call back into this manager (the dependency manager does). A
//   throwing callback is logged; the transition stands and the remaining
//   callbacks still run. unregisterCallback() waits for invocations already
//   in progress.
//
// Thread model:
//   The lifecycle map is guarded by a shared_mutex (readers: get*/list;
//   writer: createLifecycle). Each lifecycle carries its own mutex, so
//   transitions on different orders do not contend and transitions on the
//   same order are serialized.
//
// Ownership:
//   Owned by ExecutionEngine. Lifecycles live until the manager is
//   destroyed; there is no eviction.
// -----------------------------------------------------------------------------
class OrderLifecycleManager {
 public:
  static constexpr const char* kComponent = "OrderLifecycleManager";

  using Callback = std::function<void(const domain::OrderLifecycle&,
                                      const domain::OrderEvent&)>;
  using CallbackId = std::uint64_t;

  // Applied to a copy of the order under the lifecycle lock, after the
  // transition has been validated. The copy is committed with the state
  // change; if the update throws, nothing is committed.
  using OrderUpdate = std::function<void(domain::Order&)>;

  OrderLifecycleManager(const ITimeProvider& clock, ILogger& logger);

  OrderLifecycleManager(const OrderLifecycleManager&) = delete;
  OrderLifecycleManager& operator=(const OrderLifecycleManager&) = delete;

  // -------------------------------------------------------------------------
  // createLifecycle(order)
  // -------------------------------------------------------------------------
  // @brief  Starts tracking `order` in state Created with a single
  //         "ORDER_CREATED" event.
  //
  // @throws ExecutionError Validation/InvalidOrder if the ID is empty or a
  //         lifecycle already exists for it.
  //
  // Creation does not fire callbacks; nothing can subscribe to Created.
  // -------------------------------------------------------------------------
  domain::OrderLifecycle createLifecycle(const domain::Order& order);

  // @throws ExecutionError Validation/OrderNotFound
  domain::OrderLifecycle getLifecycle(const domain::OrderId& order_id) const;

  bool hasLifecycle(const domain::OrderId& order_id) const;

  // -------------------------------------------------------------------------
  // transitionState(order_id, new_state, event_type, metadata[, update])
  // -------------------------------------------------------------------------
  //
  // @brief  Validates and applies one state change.
  //
  // @return Post-transition snapshot.
  //
  // @throws ExecutionError Validation/OrderNotFound if the order is unknown.
  // @throws ExecutionError Validation/InvalidOrder
  //         "Invalid state transition from <A> to <B>" if the table forbids
  //         it. State, history and order are unchanged in that case.
  //
  // Side-effects:
  //   - current_state, order.status and updated_at change
  //   - exactly one OrderEvent is appended
  //   - callbacks registered for `new_state` run after the lock is released
  // -------------------------------------------------------------------------
  domain::OrderLifecycle transitionState(
      const domain::OrderId& order_id, domain::LifecycleState new_state,
      const std::string& event_type,
      const nlohmann::json& metadata = nlohmann::json::object(),
      const OrderUpdate& update = nullptr);

  // Mutates order fields (price, quantity after a venue modify) without a
  // state change. Records no event.
  domain::OrderLifecycle updateOrder(const domain::OrderId& order_id,
                                     const OrderUpdate& update);

  CallbackId registerCallback(domain::LifecycleState state, Callback callback);

  // -------------------------------------------------------------------------
  // unregisterCallback(id)
  // -------------------------------------------------------------------------
  // Once this returns the callback is not running on any thread and will
  // not be invoked again, so whatever it captured may be destroyed. Blocks
  // while another thread is inside the callback; must not be called from
  // within the callback being removed.
  //
  // @return false if `id` was not registered.
  // -------------------------------------------------------------------------
  bool unregisterCallback(CallbackId id);

  // Oldest first.
  std::vector<domain::OrderEvent> getOrderEvents(
      const domain::OrderId& order_id) const;

  // Non-terminal lifecycles, ordered by order ID.
  std::vector<domain::OrderLifecycle> getActiveLifecycles() const;

  // Every lifecycle, ordered by order ID.
  std::vector<domain::OrderLifecycle> getAllLifecycles() const;

  // -------------------------------------------------------------------------
  // checkExpiredOrders()
  // -------------------------------------------------------------------------
  // @brief  Moves every Acknowledged / PartiallyFilled GTD order whose
  //         expires_at is at or before now to Expired ("ORDER_EXPIRED").
  //
  // @return IDs that were expired by this call.
  //
  // An order that changes state concurrently between the scan and the
  // transition is skipped (logged at debug).
  // -------------------------------------------------------------------------
  std::vector<domain::OrderId> checkExpiredOrders();

  std::size_t size() const;

  static bool isValidTransition(domain::LifecycleState from,
                                domain::LifecycleState to);
  static bool isTerminal(domain::LifecycleState state);
  static domain::OrderStatus toOrderStatus(domain::LifecycleState state);

 private:
  struct Entry {
    mutable std::mutex mutex;
    domain::OrderLifecycle lifecycle;
  };

  struct Registration {
    CallbackId id;
    domain::LifecycleState state;
    Callback callback;
  };

  // Marks one invocation of a registered callback as finished.
  class InvocationGuard {
   public:
    InvocationGuard(OrderLifecycleManager& manager, CallbackId id)
        : manager_(manager), id_(id) {}
    ~InvocationGuard() { manager_.finishInvocation(id_); }
    InvocationGuard(const InvocationGuard&) = delete;
    InvocationGuard& operator=(const InvocationGuard&) = delete;

   private:
    OrderLifecycleManager& manager_;
    CallbackId id_;
  };

  // @return false if `id` was unregistered after notify() copied it.
  bool beginInvocation(CallbackId id);
  void finishInvocation(CallbackId id);

  std::shared_ptr<Entry> findEntry(const domain::OrderId& order_id) const;
  std::vector<std::shared_ptr<Entry>> allEntries() const;

  void notify(const domain::OrderLifecycle& lifecycle,
              const domain::OrderEvent& event);

  Timestamp now() const;

  const ITimeProvider& clock_;
  ILogger& logger_;
  SequenceGenerator event_ids_{"evt"};

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<domain::OrderId, std::shared_ptr<Entry>> lifecycles_;

  std::mutex callbacks_mutex_;
  std::condition_variable callbacks_cv_;
  std::vector<Registration> callbacks_;
  std::unordered_map<CallbackId, int> in_flight_;
  CallbackId next_callback_id_{1};
};

}  // namespace orex

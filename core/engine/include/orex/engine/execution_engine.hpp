#pragma once

#include "orex/broker/broker_connector_factory.hpp"
#include "orex/broker/broker_router.hpp"
#include "orex/concurrent/sequence_generator.hpp"
#include "orex/concurrent/task_loop_thread.hpp"
#include "orex/config/engine_config.hpp"
#include "orex/domain/order_lifecycle.hpp"
#include "orex/domain/portfolio.hpp"
#include "orex/engine/dead_letter_queue.hpp"
#include "orex/errors/error_handler.hpp"
#include "orex/lifecycle/order_dependency_manager.hpp"
#include "orex/lifecycle/order_lifecycle_manager.hpp"
#include "orex/logging/logger.hpp"
#include "orex/monitoring/order_monitor.hpp"
#include "orex/network/control_server.hpp"
#include "orex/resilience/call_context.hpp"
#include "orex/resilience/circuit_breaker_registry.hpp"
#include "orex/risk/i_risk_manager.hpp"
#include "orex/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// SubmissionResult — what submitOrder() / retryDeadLetter() report back
// -----------------------------------------------------------------------------
//   state            lifecycle state when the call returned (Submitted on
//                    success, Validated for a child waiting on its parent,
//                    Rejected or Failed otherwise)
//   broker_order_id  venue ID when the order reached the venue
//   attempts         venue calls made (0 if the order never left the engine)
//   error            set whenever the order did not reach the venue, except
//                    for a waiting child
// -----------------------------------------------------------------------------
struct SubmissionResult {
  domain::OrderId order_id;
  domain::LifecycleState state{domain::LifecycleState::Created};
  std::string broker_order_id;
  int attempts{0};
  std::optional<ExecutionError> error;

  bool accepted() const { return !error.has_value(); }
};

nlohmann::json toJson(const SubmissionResult& result);

// -----------------------------------------------------------------------------
// ExecutionEngine — the orchestration root
// -----------------------------------------------------------------------------
//
// @brief  Owns every manager, runs the submission loop with backoff, turns
//         venue execution reports into lifecycle transitions, and serves
//         the control plane.
//
// @details
// Submission (submitOrder):
//
//   createLifecycle ─> risk validate ──breach──> Rejected  (RISK_REJECTED)
//                            │
//                            v
//                        Validated (VALIDATION_PASSED)
//                            │
//            parent_order_id? ──yes──> OTO dependency, child waits
//                            │
//                            v
//        ┌──> router.placeOrder ──ok──> Submitted (ORDER_SUBMITTED)
//        │         │
//        │     should_retry? ──no──> Validation: Rejected (BROKER_REJECTED)
//        │         │                 otherwise:  Failed (SUBMISSION_FAILED)
//        │         │                             + dead-letter queue
//        └─ sleep retry_delay (cut short by stop())
//
// Orders with a non-empty client_id different from the user's own session
// client are placed through the dealer path.
//
// OTO children are moved to Submitted by the dependency manager and then
// placed from the engine's worker thread with the user recorded at their
// own submitOrder() call.
//
// Execution reports:
//   A report may arrive before the submission loop has recorded Submitted.
//   Reports for orders still in Created/Validated are buffered and applied
//   right after the Submitted transition. All report application is
//   serialized so cumulative fills are applied in arrival order.
//
// Modification:
//   An order whose placement is in flight has no venue ID yet. Modifying
//   it is refused until the placement returns; afterwards the change goes
//   to the venue.
//
// Thread model:
//   Public methods are safe from any thread. Threads owned while running:
//   "engine_worker" (child placement, OCO venue cancels), the maintenance
//   thread (expiry sweep, order monitoring), the control server thread,
//   plus the dependency manager's own worker.
//
// Ownership:
//   Everything by value or unique_ptr, declared so that consumers are
//   destroyed before what they reference. Holds references to the clock
//   and the logger, which must outlive the engine.
// -----------------------------------------------------------------------------
class ExecutionEngine {
 public:
  static constexpr const char* kComponent = "ExecutionEngine";

  using TelemetrySink = std::function<void(const nlohmann::json&)>;

  ExecutionEngine(EngineConfig config, const ITimeProvider& clock,
                  ILogger& logger,
                  std::shared_ptr<BrokerConnectorFactory> factory);
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;
  ExecutionEngine(ExecutionEngine&&) = delete;
  ExecutionEngine& operator=(ExecutionEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start() / stop()
  // -------------------------------------------------------------------------
  // start(): starts the worker and maintenance threads, logs in the
  // configured sessions (a failed login is logged, not thrown) and opens
  // the control server when both endpoints are set.
  //
  // stop(): cancels in-flight venue calls and backoff waits, closes the
  // control server and joins the maintenance thread. It then stops the
  // dependency manager, lets the worker finish what it was handed (those
  // venue calls fail fast on the cancelled token), joins it and
  // disconnects every connector.
  //
  // Both idempotent. Call from one thread.
  // -------------------------------------------------------------------------
  void start();
  void stop();
  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // submitOrder(user_id, order, portfolio, strategy)
  // -------------------------------------------------------------------------
  // @throws ExecutionError Validation/InvalidOrder only when the order
  //         cannot be tracked (empty or duplicate ID). Every other outcome
  //         is reported in the result.
  // -------------------------------------------------------------------------
  SubmissionResult submitOrder(const std::string& user_id,
                               const domain::Order& order,
                               const domain::Portfolio& portfolio,
                               const domain::Strategy& strategy);

  // -------------------------------------------------------------------------
  // cancelOrder(order_id)
  // -------------------------------------------------------------------------
  // Orders not yet at the venue go straight to Cancelled. Orders at the
  // venue go to Cancelling, then Cancelled once the venue accepts.
  //
  // @throws ExecutionError Validation/OrderNotFound, Validation/InvalidOrder
  //         for a terminal order, or the venue's final error.
  // -------------------------------------------------------------------------
  domain::OrderLifecycle cancelOrder(const domain::OrderId& order_id);

  // -------------------------------------------------------------------------
  // modifyOrder(order_id, price, quantity, trigger_price)
  // -------------------------------------------------------------------------
  // Unset arguments keep the current value. Orders not yet at the venue
  // are changed locally.
  //
  // @throws ExecutionError Validation/InvalidOrder for a terminal or
  //         cancelling order, or while its placement is in flight
  //         ("Order <id> is being placed and cannot be modified yet");
  //         Validation/InvalidParameter for bad values; or the venue's
  //         final error.
  // -------------------------------------------------------------------------
  domain::OrderLifecycle modifyOrder(const domain::OrderId& order_id,
                                     std::optional<double> price,
                                     std::optional<std::int64_t> quantity,
                                     std::optional<double> trigger_price);

  // Polls the venue for the order and applies what it reports.
  domain::OrderLifecycle syncOrderStatus(const domain::OrderId& order_id);

  // -------------------------------------------------------------------------
  // retryDeadLetter(order_id)
  // -------------------------------------------------------------------------
  // Resubmits a dead-lettered order under a new ID ("<id>-retry-<n>") with
  // the portfolio and strategy of its original submission. The entry
  // leaves the queue; a new failure dead-letters the new ID.
  //
  // @throws ExecutionError Validation/OrderNotFound if not queued.
  // -------------------------------------------------------------------------
  SubmissionResult retryDeadLetter(const domain::OrderId& order_id);

  void onExecutionReport(const domain::ExecutionReport& report);

  // Runs one expiry sweep. @return IDs moved to Expired.
  std::vector<domain::OrderId> sweepExpiredOrders();

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // Control-plane entry point. `request` is either a bare command word
  // ("PING") or a JSON object {"command": "...", ...}. Always returns a
  // JSON object with "status" = "ok" or "error".
  //
  // Commands: PING, STATUS, BREAKERS, RESET_BREAKER{name}, DEAD_LETTERS,
  // RETRY_DEAD_LETTER{order_id}, LIFECYCLE{order_id}, SUBMIT_ORDER{user_id,
  // order, portfolio, strategy}, CANCEL_ORDER{order_id}, SNAPSHOT, ALERTS,
  // ACK_ALERT{order_id, alert_type}.
  // -------------------------------------------------------------------------
  nlohmann::json executeCommand(const std::string& request);

  // Lifecycles, dependencies, risk profiles and dead letters as one JSON
  // document for a persistence collaborator.
  nlohmann::json snapshot() const;

  // Receives one JSON object per lifecycle transition ("type": "lifecycle")
  // and one per new order alert ("type": "alert").
  void setTelemetrySink(TelemetrySink sink);

  // Blocks until the engine worker and dependency worker are idle.
  bool waitForIdle(std::chrono::milliseconds timeout =
                       std::chrono::milliseconds(5000));

  OrderLifecycleManager& lifecycles() { return lifecycles_; }
  OrderMonitor& monitor() { return monitor_; }
  OrderDependencyManager& dependencies() { return *dependencies_; }
  BrokerRouter& router() { return *router_; }
  IRiskManager& riskManager() { return *risk_; }
  CircuitBreakerRegistry& breakers() { return breakers_; }
  DeadLetterQueue& deadLetters() { return dead_letters_; }
  IErrorHandler& errorHandler() { return errors_; }
  const EngineConfig& config() const { return config_; }

 private:
  struct OrderContext {
    std::string user_id;
    domain::Portfolio portfolio;
    domain::Strategy strategy;
  };

  // Marks an order as being placed for the guard's lifetime.
  class PlacementGuard {
   public:
    PlacementGuard(ExecutionEngine& engine, domain::OrderId order_id);
    ~PlacementGuard();

    PlacementGuard(const PlacementGuard&) = delete;
    PlacementGuard& operator=(const PlacementGuard&) = delete;

   private:
    ExecutionEngine& engine_;
    const domain::OrderId order_id_;
  };

  // Runs `call` until it succeeds, the classifier says stop, or the
  // engine stops.
  template <typename T, typename Call>
  RouteResult<T> withRetry(Call&& call);

  // Venue placement plus the outcome transitions. `already_submitted` is
  // true for OTO children, which the dependency manager moved to
  // Submitted before handing them over.
  SubmissionResult place(const domain::OrderId& order_id,
                         bool already_submitted);

  RouteResult<domain::BrokerOrderResponse> placeAtVenue(
      const std::string& user_id, const domain::Order& order,
      const CallContext& ctx);

  void onChildTriggered(const domain::OrderLifecycle& child);
  void onOcoCancel(const domain::OrderId& child_id);

  // The venue accepted an order the engine no longer wants (cancelled
  // locally while the placement was in flight). Best effort.
  void cancelStrayVenueOrder(const domain::OrderId& order_id,
                             const std::string& user_id,
                             const std::string& broker_order_id);

  // Caller holds reports_mutex_.
  void applyReportLocked(const domain::OrderId& order_id,
                         const domain::ExecutionReport& report);
  // @return false when the transition was refused (logged at debug).
  bool transitionQuietly(const domain::OrderId& order_id,
                         domain::LifecycleState state,
                         const std::string& event_type,
                         const nlohmann::json& metadata,
                         const OrderLifecycleManager::OrderUpdate& update =
                             nullptr);

  std::optional<OrderContext> contextFor(const domain::OrderId& order_id) const;
  std::optional<domain::OrderId> resolveReportOrder(
      const domain::ExecutionReport& report) const;

  CallContext callContext() const;
  bool sleepUnlessStopped(std::chrono::milliseconds delay);

  void publish(const domain::OrderLifecycle& lifecycle,
               const domain::OrderEvent& event);
  void publishAlert(const OrderAlert& alert);
  void sendTelemetry(const nlohmann::json& message);
  void runMaintenance();

  nlohmann::json statusJson() const;

  const EngineConfig config_;
  const ITimeProvider& clock_;
  ILogger& logger_;
  std::shared_ptr<BrokerConnectorFactory> factory_;

  DefaultErrorHandler errors_;
  CircuitBreakerRegistry breakers_;
  std::unique_ptr<IRiskManager> risk_;
  OrderLifecycleManager lifecycles_;
  OrderMonitor monitor_;

  // Declared before the dependency manager, whose hooks post to it.
  TaskLoopThread worker_{"engine_worker"};
  std::unique_ptr<OrderDependencyManager> dependencies_;
  std::unique_ptr<BrokerRouter> router_;
  DeadLetterQueue dead_letters_;
  SequenceGenerator retry_ids_{"retry"};

  mutable std::mutex contexts_mutex_;
  std::unordered_map<domain::OrderId, OrderContext> contexts_;
  std::unordered_map<std::string, domain::OrderId> broker_to_order_;

  std::mutex placement_mutex_;
  std::unordered_set<domain::OrderId> placing_;

  std::mutex reports_mutex_;
  std::unordered_map<domain::OrderId, std::vector<domain::ExecutionReport>>
      pending_reports_;

  std::mutex telemetry_mutex_;
  TelemetrySink telemetry_sink_;
  std::vector<OrderLifecycleManager::CallbackId> lifecycle_subscriptions_;

  mutable std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::shared_ptr<CancellationToken> stop_token_;

  std::atomic<bool> running_{false};
  std::thread maintenance_thread_;

  std::unique_ptr<ControlServer> control_server_;
};

}  // namespace orex

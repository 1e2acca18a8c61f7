// =============================================================================
// order_lifecycle_manager_test.cpp
// =============================================================================
// Unit tests for orex::OrderLifecycleManager.
//
// Validates:
//   - Creation records a single ORDER_CREATED event and rejects duplicates
//   - The full transition table, pair by pair, including terminal states
//   - A throwing order update commits nothing
//   - Event history order and metadata
//   - Callbacks fire per target state, and a throwing callback is isolated
//   - unregisterCallback() waits for an invocation already running
//   - GTD expiry sweep only touches working orders past their deadline
// =============================================================================

#include "orex/errors/execution_error.hpp"
#include "orex/lifecycle/order_lifecycle_manager.hpp"
#include "orex/time/simulation_time_provider.hpp"

#include "support/order_builders.hpp"
#include "support/recording_logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using orex::ErrorCode;
using orex::ExecutionError;
using orex::OrderLifecycleManager;
using orex::domain::LifecycleState;
using orex::domain::OrderStatus;
using orex::testing::makeOrder;

class OrderLifecycleManagerTest : public ::testing::Test {
 protected:
  orex::SimulationTimeProvider clock{1'000};
  orex::testing::RecordingLogger logger;
  OrderLifecycleManager manager{clock, logger};

  void walkToAcknowledged(const std::string& id) {
    manager.transitionState(id, LifecycleState::Validated, "VALIDATION_PASSED");
    manager.transitionState(id, LifecycleState::Submitted, "ORDER_SUBMITTED");
    manager.transitionState(id, LifecycleState::Acknowledged,
                            "ORDER_ACKNOWLEDGED");
  }
};

// -----------------------------------------------------------------------------
// 1. A new lifecycle starts in Created with exactly one event.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleManagerTest, CreateStartsInCreated) {
  auto lc = manager.createLifecycle(makeOrder("ord-1"));

  EXPECT_EQ(lc.current_state, LifecycleState::Created);
  EXPECT_EQ(lc.order.status, OrderStatus::New);
  ASSERT_EQ(lc.events.size(), 1u);
  EXPECT_EQ(lc.events[0].event_type, "ORDER_CREATED");
  EXPECT_FALSE(lc.events[0].previous_state.has_value());
  EXPECT_EQ(orex::timestamp_to_ms(lc.created_at), 1'000);
  EXPECT_TRUE(manager.hasLifecycle("ord-1"));
}

TEST_F(OrderLifecycleManagerTest, DuplicateAndEmptyIdsAreRejected) {
  manager.createLifecycle(makeOrder("ord-1"));

  try {
    manager.createLifecycle(makeOrder("ord-1"));
    FAIL() << "duplicate ID accepted";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidOrder);
    EXPECT_EQ(e.message(), "Order lifecycle already exists for order ID ord-1");
  }

  EXPECT_THROW(manager.createLifecycle(makeOrder("")), ExecutionError);
  EXPECT_EQ(manager.size(), 1u);
}

TEST_F(OrderLifecycleManagerTest, UnknownOrderIsNotFound) {
  try {
    manager.getLifecycle("missing");
    FAIL() << "expected OrderNotFound";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::OrderNotFound);
    EXPECT_EQ(e.orderId(), "missing");
  }
  EXPECT_THROW(manager.transitionState("missing", LifecycleState::Validated,
                                       "VALIDATION_PASSED"),
               ExecutionError);
}

// -----------------------------------------------------------------------------
// 2. Happy path: events accumulate in order with previous/next states.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleManagerTest, HappyPathRecordsEveryTransition) {
  manager.createLifecycle(makeOrder("ord-1"));
  walkToAcknowledged("ord-1");
  clock.advance_by(50);
  auto lc = manager.transitionState(
      "ord-1", LifecycleState::Completed, "ORDER_FILLED",
      {{"fillPrice", 101.5}},
      [](orex::domain::Order& o) { o.filled_quantity = o.quantity; });

  EXPECT_EQ(lc.current_state, LifecycleState::Completed);
  EXPECT_EQ(lc.order.status, OrderStatus::Filled);
  EXPECT_EQ(lc.order.filled_quantity, 10);

  auto events = manager.getOrderEvents("ord-1");
  ASSERT_EQ(events.size(), 5u);
  ASSERT_TRUE(events[1].previous_state.has_value());
  EXPECT_EQ(*events[1].previous_state, LifecycleState::Created);
  EXPECT_EQ(events[1].state, LifecycleState::Validated);
  EXPECT_EQ(events[4].event_type, "ORDER_FILLED");
  EXPECT_DOUBLE_EQ(events[4].metadata.at("fillPrice").get<double>(), 101.5);
  EXPECT_EQ(orex::timestamp_to_ms(events[4].timestamp), 1'050);
}

// -----------------------------------------------------------------------------
// 3. Invalid transitions are refused and leave state untouched.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleManagerTest, InvalidTransitionIsRefused) {
  manager.createLifecycle(makeOrder("ord-1"));

  try {
    manager.transitionState("ord-1", LifecycleState::Completed, "ORDER_FILLED");
    FAIL() << "Created -> Completed accepted";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidOrder);
    EXPECT_EQ(e.message(), "Invalid state transition from CREATED to COMPLETED");
  }

  auto lc = manager.getLifecycle("ord-1");
  EXPECT_EQ(lc.current_state, LifecycleState::Created);
  EXPECT_EQ(lc.events.size(), 1u);
}

TEST_F(OrderLifecycleManagerTest, TerminalStatesHaveNoExits) {
  for (auto terminal : {LifecycleState::Completed, LifecycleState::Cancelled,
                        LifecycleState::Rejected, LifecycleState::Expired,
                        LifecycleState::Failed}) {
    EXPECT_TRUE(OrderLifecycleManager::isTerminal(terminal));
    for (auto to : orex::domain::kAllLifecycleStates) {
      EXPECT_FALSE(OrderLifecycleManager::isValidTransition(terminal, to))
          << orex::domain::toString(terminal) << " -> "
          << orex::domain::toString(to);
    }
  }
}

// Every (from, to) pair, driven through transitionState(). Allowed pairs
// succeed with one new event; refused pairs throw and change nothing.
TEST_F(OrderLifecycleManagerTest, FullTransitionTable) {
  using S = LifecycleState;
  const std::map<S, std::set<S>> allowed = {
      {S::Created, {S::Validated, S::Cancelled, S::Rejected, S::Failed}},
      {S::Validated, {S::Submitted, S::Cancelled, S::Rejected, S::Failed}},
      {S::Submitted,
       {S::Acknowledged, S::Cancelling, S::Cancelled, S::Rejected, S::Failed}},
      {S::Acknowledged,
       {S::PartiallyFilled, S::Completed, S::Cancelling, S::Cancelled,
        S::Rejected, S::Failed, S::Expired}},
      {S::PartiallyFilled,
       {S::PartiallyFilled, S::Completed, S::Cancelling, S::Cancelled,
        S::Rejected, S::Failed, S::Expired}},
      {S::Cancelling, {S::Completed, S::Cancelled, S::Rejected, S::Failed}},
      {S::Completed, {}},
      {S::Cancelled, {}},
      {S::Rejected, {}},
      {S::Expired, {}},
      {S::Failed, {}},
  };
  const std::map<S, std::vector<S>> path_to = {
      {S::Created, {}},
      {S::Validated, {S::Validated}},
      {S::Submitted, {S::Validated, S::Submitted}},
      {S::Acknowledged, {S::Validated, S::Submitted, S::Acknowledged}},
      {S::PartiallyFilled,
       {S::Validated, S::Submitted, S::Acknowledged, S::PartiallyFilled}},
      {S::Completed,
       {S::Validated, S::Submitted, S::Acknowledged, S::Completed}},
      {S::Cancelling, {S::Validated, S::Submitted, S::Cancelling}},
      {S::Cancelled, {S::Cancelled}},
      {S::Rejected, {S::Rejected}},
      {S::Expired, {S::Validated, S::Submitted, S::Acknowledged, S::Expired}},
      {S::Failed, {S::Failed}},
  };

  for (S from : orex::domain::kAllLifecycleStates) {
    for (S to : orex::domain::kAllLifecycleStates) {
      const std::string id = std::string("ord-") +
                             orex::domain::toString(from) + "-" +
                             orex::domain::toString(to);
      SCOPED_TRACE(id);
      manager.createLifecycle(makeOrder(id));
      for (S step : path_to.at(from)) {
        manager.transitionState(id, step, "SETUP");
      }
      const auto before = manager.getLifecycle(id);
      ASSERT_EQ(before.current_state, from);

      const bool legal = allowed.at(from).count(to) != 0;
      EXPECT_EQ(OrderLifecycleManager::isValidTransition(from, to), legal);

      if (legal) {
        auto after = manager.transitionState(id, to, "UNDER_TEST");
        EXPECT_EQ(after.current_state, to);
        EXPECT_EQ(after.events.size(), before.events.size() + 1);
      } else {
        EXPECT_THROW(manager.transitionState(id, to, "UNDER_TEST"),
                     ExecutionError);
        const auto after = manager.getLifecycle(id);
        EXPECT_EQ(after.current_state, from);
        EXPECT_EQ(after.events.size(), before.events.size());
      }
    }
  }
}

TEST_F(OrderLifecycleManagerTest, ThrowingUpdateLeavesLifecycleUntouched) {
  manager.createLifecycle(makeOrder("ord-1"));
  const double price = manager.getLifecycle("ord-1").order.price;

  EXPECT_THROW(manager.transitionState(
                   "ord-1", LifecycleState::Validated, "VALIDATION_PASSED",
                   nlohmann::json::object(),
                   [](orex::domain::Order& o) {
                     o.price = 1.0;
                     throw std::runtime_error("half-applied");
                   }),
               std::runtime_error);

  auto lc = manager.getLifecycle("ord-1");
  EXPECT_EQ(lc.current_state, LifecycleState::Created);
  EXPECT_DOUBLE_EQ(lc.order.price, price);
  EXPECT_EQ(lc.events.size(), 1u);

  EXPECT_THROW(manager.updateOrder("ord-1",
                                   [](orex::domain::Order& o) {
                                     o.quantity = 1;
                                     throw std::runtime_error("half-applied");
                                   }),
               std::runtime_error);
  EXPECT_EQ(manager.getLifecycle("ord-1").order.quantity, lc.order.quantity);
}

// -----------------------------------------------------------------------------
// 4. Callbacks: per-state, not on create, isolated from each other.
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleManagerTest, CallbacksFireForTheirStateOnly) {
  std::vector<std::string> seen;
  manager.registerCallback(LifecycleState::Created,
                           [&](const auto&, const auto&) { seen.push_back("C"); });
  manager.registerCallback(
      LifecycleState::Validated, [&](const auto& lc, const auto& event) {
        seen.push_back(lc.order.id + ":" + event.event_type);
      });

  manager.createLifecycle(makeOrder("ord-1"));
  manager.transitionState("ord-1", LifecycleState::Validated,
                          "VALIDATION_PASSED");
  manager.transitionState("ord-1", LifecycleState::Submitted, "ORDER_SUBMITTED");

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], "ord-1:VALIDATION_PASSED");
}

TEST_F(OrderLifecycleManagerTest, ThrowingCallbackDoesNotStopOthers) {
  std::atomic<int> calls{0};
  manager.registerCallback(LifecycleState::Validated,
                           [](const auto&, const auto&) {
                             throw std::runtime_error("boom");
                           });
  manager.registerCallback(LifecycleState::Validated,
                           [&](const auto&, const auto&) { ++calls; });

  manager.createLifecycle(makeOrder("ord-1"));
  auto lc = manager.transitionState("ord-1", LifecycleState::Validated,
                                    "VALIDATION_PASSED");

  EXPECT_EQ(lc.current_state, LifecycleState::Validated);
  EXPECT_EQ(calls.load(), 1);
  EXPECT_TRUE(logger.contains("lifecycle callback threw"));
}

TEST_F(OrderLifecycleManagerTest, UnregisteredCallbackIsSilent) {
  int calls = 0;
  auto id = manager.registerCallback(LifecycleState::Validated,
                                     [&](const auto&, const auto&) { ++calls; });
  EXPECT_TRUE(manager.unregisterCallback(id));
  EXPECT_FALSE(manager.unregisterCallback(id));

  manager.createLifecycle(makeOrder("ord-1"));
  manager.transitionState("ord-1", LifecycleState::Validated,
                          "VALIDATION_PASSED");
  EXPECT_EQ(calls, 0);
}

TEST_F(OrderLifecycleManagerTest, UnregisterWaitsForRunningCallback) {
  std::promise<void> entered;
  std::future<void> entered_future = entered.get_future();
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::atomic<bool> finished{false};

  auto id = manager.registerCallback(
      LifecycleState::Validated, [&](const auto&, const auto&) {
        entered.set_value();
        released.wait();
        finished.store(true);
      });
  manager.createLifecycle(makeOrder("ord-1"));

  std::thread transition([&] {
    manager.transitionState("ord-1", LifecycleState::Validated,
                            "VALIDATION_PASSED");
  });
  entered_future.wait();

  std::atomic<bool> unregistered{false};
  std::thread remover([&] {
    EXPECT_TRUE(manager.unregisterCallback(id));
    EXPECT_TRUE(finished.load());
    unregistered.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(unregistered.load());

  release.set_value();
  remover.join();
  transition.join();
  EXPECT_TRUE(unregistered.load());
}

// -----------------------------------------------------------------------------
// 5. Queries
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleManagerTest, ActiveExcludesTerminal) {
  manager.createLifecycle(makeOrder("ord-b"));
  manager.createLifecycle(makeOrder("ord-a"));
  manager.createLifecycle(makeOrder("ord-c"));
  manager.transitionState("ord-c", LifecycleState::Rejected, "RISK_REJECTED");

  auto active = manager.getActiveLifecycles();
  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0].order.id, "ord-a");
  EXPECT_EQ(active[1].order.id, "ord-b");
  EXPECT_EQ(manager.getAllLifecycles().size(), 3u);
}

TEST_F(OrderLifecycleManagerTest, UpdateOrderKeepsState) {
  manager.createLifecycle(makeOrder("ord-1"));
  auto lc = manager.updateOrder(
      "ord-1", [](orex::domain::Order& o) { o.price = 99.0; });

  EXPECT_EQ(lc.current_state, LifecycleState::Created);
  EXPECT_DOUBLE_EQ(lc.order.price, 99.0);
  EXPECT_EQ(lc.events.size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. Expiry sweep
// -----------------------------------------------------------------------------
TEST_F(OrderLifecycleManagerTest, ExpirySweepMovesWorkingGtdOrders) {
  auto gtd = makeOrder("ord-gtd");
  gtd.validity = orex::domain::Validity::GTD;
  gtd.expires_at = orex::ms_to_timestamp(2'000);
  manager.createLifecycle(gtd);
  walkToAcknowledged("ord-gtd");

  auto pending = gtd;
  pending.id = "ord-pending";
  manager.createLifecycle(pending);  // still Created: never expired locally

  auto day = makeOrder("ord-day");
  manager.createLifecycle(day);
  walkToAcknowledged("ord-day");

  EXPECT_TRUE(manager.checkExpiredOrders().empty());

  clock.advance_time(2'000);
  auto expired = manager.checkExpiredOrders();
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0], "ord-gtd");

  auto lc = manager.getLifecycle("ord-gtd");
  EXPECT_EQ(lc.current_state, LifecycleState::Expired);
  EXPECT_EQ(lc.events.back().event_type, "ORDER_EXPIRED");
  EXPECT_EQ(manager.getLifecycle("ord-pending").current_state,
            LifecycleState::Created);

  EXPECT_TRUE(manager.checkExpiredOrders().empty());
}

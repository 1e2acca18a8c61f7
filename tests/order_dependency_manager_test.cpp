// =============================================================================
// order_dependency_manager_test.cpp
// =============================================================================
// Unit tests for orex::OrderDependencyManager.
//
// Validates:
//   - Registration rules: both orders exist, no duplicates, one parent per
//     child, no cycles
//   - One-triggers-other: parent completion walks the child to Submitted
//     and hands it to the hook exactly once
//   - Parent termination cancels a child that never reached the venue
//   - One-cancels-other: local cancel before the venue, hook at the venue
//   - Failures are routed through the error classifier and logged
//   - stop() finishes posted trigger work; a stopped manager ignores
//     parents until start() subscribes again
//
// Threading model:
//   Lifecycle callbacks hand work to the manager's own loop; every test
//   waits for it with waitForIdle() before asserting.
// =============================================================================

#include "orex/errors/error_handler.hpp"
#include "orex/lifecycle/order_dependency_manager.hpp"
#include "orex/lifecycle/order_lifecycle_manager.hpp"
#include "orex/time/simulation_time_provider.hpp"

#include "support/order_builders.hpp"
#include "support/recording_logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using orex::ErrorCode;
using orex::ExecutionError;
using orex::domain::DependencyType;
using orex::domain::LifecycleState;
using orex::testing::makeOrder;

class OrderDependencyManagerTest : public ::testing::Test {
 protected:
  OrderDependencyManagerTest() {
    orex::OrderDependencyManager::Hooks hooks;
    hooks.on_child_triggered = [this](const orex::domain::OrderLifecycle& c) {
      std::lock_guard lock(mutex);
      triggered.push_back(c.order.id);
      triggered_states.push_back(c.current_state);
    };
    hooks.cancel_child = [this](const orex::domain::OrderId& id) {
      std::lock_guard lock(mutex);
      venue_cancels.push_back(id);
    };
    deps.setHooks(std::move(hooks));
  }

  void create(const std::string& id) { lifecycles.createLifecycle(makeOrder(id)); }

  void toAcknowledged(const std::string& id) {
    lifecycles.transitionState(id, LifecycleState::Validated, "VALIDATION_PASSED");
    lifecycles.transitionState(id, LifecycleState::Submitted, "ORDER_SUBMITTED");
    lifecycles.transitionState(id, LifecycleState::Acknowledged,
                               "ORDER_ACKNOWLEDGED");
  }

  void complete(const std::string& id) {
    toAcknowledged(id);
    lifecycles.transitionState(id, LifecycleState::Completed, "ORDER_FILLED");
  }

  LifecycleState stateOf(const std::string& id) {
    return lifecycles.getLifecycle(id).current_state;
  }

  orex::SimulationTimeProvider clock{5'000};
  orex::testing::RecordingLogger logger;
  orex::DefaultErrorHandler errors{orex::RetryPolicy{}, logger};
  orex::OrderLifecycleManager lifecycles{clock, logger};
  orex::OrderDependencyManager deps{lifecycles, errors, clock, logger};

  std::mutex mutex;
  std::vector<std::string> triggered;
  std::vector<LifecycleState> triggered_states;
  std::vector<std::string> venue_cancels;
};

// -----------------------------------------------------------------------------
// 1. Registration
// -----------------------------------------------------------------------------
TEST_F(OrderDependencyManagerTest, CreateAndQuery) {
  create("parent");
  create("child");

  auto dep = deps.createDependency("parent", "child",
                                   DependencyType::OneTriggersOther, "on fill");
  EXPECT_EQ(dep.id, "dep-1");
  EXPECT_EQ(dep.condition, "on fill");
  EXPECT_EQ(orex::timestamp_to_ms(dep.created_at), 5'000);

  ASSERT_EQ(deps.getDependencies("parent").size(), 1u);
  EXPECT_TRUE(deps.getDependencies("child").empty());
  EXPECT_EQ(deps.getParentOrder("child"), "parent");
  EXPECT_EQ(deps.allDependencies().size(), 1u);
}

TEST_F(OrderDependencyManagerTest, UnknownOrdersAreRejected) {
  create("child");
  try {
    deps.createDependency("ghost", "child", DependencyType::OneTriggersOther);
    FAIL() << "unknown parent accepted";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidParameter);
    EXPECT_EQ(e.message(), "Parent order not found: ghost");
  }
  EXPECT_THROW(deps.createDependency("child", "ghost",
                                     DependencyType::OneTriggersOther),
               ExecutionError);
}

TEST_F(OrderDependencyManagerTest, DuplicateSecondParentAndCycleAreRejected) {
  create("a");
  create("b");
  create("c");
  deps.createDependency("a", "b", DependencyType::OneTriggersOther);
  deps.createDependency("b", "c", DependencyType::OneTriggersOther);

  EXPECT_THROW(deps.createDependency("a", "b", DependencyType::OneCancelsOther),
               ExecutionError);
  EXPECT_THROW(deps.createDependency("c", "b", DependencyType::OneTriggersOther),
               ExecutionError);

  try {
    deps.createDependency("c", "a", DependencyType::OneTriggersOther);
    FAIL() << "cycle accepted";
  } catch (const ExecutionError& e) {
    EXPECT_NE(e.message().find("cycle"), std::string::npos);
  }
  EXPECT_THROW(deps.createDependency("a", "a", DependencyType::OneTriggersOther),
               ExecutionError);
  EXPECT_EQ(deps.allDependencies().size(), 2u);
}

TEST_F(OrderDependencyManagerTest, DeleteDependencyFreesTheChild) {
  create("parent");
  create("child");
  auto dep = deps.createDependency("parent", "child",
                                   DependencyType::OneTriggersOther);

  deps.deleteDependency(dep.id);
  EXPECT_TRUE(deps.allDependencies().empty());
  EXPECT_THROW(deps.getParentOrder("child"), ExecutionError);
  EXPECT_THROW(deps.deleteDependency(dep.id), ExecutionError);

  create("other");
  EXPECT_NO_THROW(deps.createDependency("other", "child",
                                        DependencyType::OneTriggersOther));
}

// -----------------------------------------------------------------------------
// 2. One-triggers-other
// -----------------------------------------------------------------------------
TEST_F(OrderDependencyManagerTest, ParentFillSubmitsChild) {
  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneTriggersOther);

  complete("parent");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Submitted);
  std::lock_guard lock(mutex);
  ASSERT_EQ(triggered.size(), 1u);
  EXPECT_EQ(triggered[0], "child");
  EXPECT_EQ(triggered_states[0], LifecycleState::Submitted);

  auto events = lifecycles.getOrderEvents("child");
  EXPECT_EQ(events.back().event_type, "PARENT_COMPLETED");
  EXPECT_EQ(events.back().metadata.at("parentOrderId"), "parent");
}

TEST_F(OrderDependencyManagerTest, TriggerHappensAtMostOnce) {
  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneTriggersOther);

  complete("parent");
  ASSERT_TRUE(deps.waitForIdle());
  deps.onParentCompleted("parent");

  std::lock_guard lock(mutex);
  EXPECT_EQ(triggered.size(), 1u);
}

TEST_F(OrderDependencyManagerTest, StopFinishesPostedTriggerWork) {
  orex::OrderDependencyManager::Hooks hooks;
  hooks.on_child_triggered = [this](const orex::domain::OrderLifecycle& c) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::lock_guard lock(mutex);
    triggered.push_back(c.order.id);
  };
  deps.setHooks(std::move(hooks));

  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneTriggersOther);

  // The completion callback has posted the trigger by the time this returns.
  complete("parent");
  deps.stop();

  EXPECT_EQ(stateOf("child"), LifecycleState::Submitted);
  std::lock_guard lock(mutex);
  ASSERT_EQ(triggered.size(), 1u);
  EXPECT_EQ(triggered[0], "child");
}

TEST_F(OrderDependencyManagerTest, StoppedManagerIgnoresParentsUntilStarted) {
  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneTriggersOther);

  deps.stop();
  deps.stop();
  complete("parent");
  EXPECT_EQ(stateOf("child"), LifecycleState::Created);

  deps.start();
  create("parent-2");
  create("child-2");
  deps.createDependency("parent-2", "child-2",
                        DependencyType::OneTriggersOther);
  complete("parent-2");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Created);
  EXPECT_EQ(stateOf("child-2"), LifecycleState::Submitted);
  std::lock_guard lock(mutex);
  EXPECT_EQ(triggered, std::vector<std::string>{"child-2"});
}

TEST_F(OrderDependencyManagerTest, ParentCancelCancelsWaitingChild) {
  create("parent");
  create("child");
  lifecycles.transitionState("child", LifecycleState::Validated,
                             "VALIDATION_PASSED");
  deps.createDependency("parent", "child", DependencyType::OneTriggersOther);

  lifecycles.transitionState("parent", LifecycleState::Cancelled,
                             "ORDER_CANCELLED");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Cancelled);
  EXPECT_EQ(lifecycles.getOrderEvents("child").back().event_type,
            "PARENT_TERMINATED");
  std::lock_guard lock(mutex);
  EXPECT_TRUE(triggered.empty());
}

TEST_F(OrderDependencyManagerTest, TerminalChildIsReportedNotTriggered) {
  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneTriggersOther);
  lifecycles.transitionState("child", LifecycleState::Rejected, "RISK_REJECTED");

  complete("parent");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Rejected);
  EXPECT_TRUE(logger.contains("dependency trigger failed"));
  EXPECT_EQ(errors.trackedContexts(), 0u);
}

// -----------------------------------------------------------------------------
// 3. One-cancels-other
// -----------------------------------------------------------------------------
TEST_F(OrderDependencyManagerTest, OcoCancelsLocalChildDirectly) {
  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneCancelsOther);

  complete("parent");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Cancelled);
  std::lock_guard lock(mutex);
  EXPECT_TRUE(venue_cancels.empty());
}

TEST_F(OrderDependencyManagerTest, OcoHandsVenueChildToHook) {
  create("parent");
  create("child");
  toAcknowledged("child");
  deps.createDependency("parent", "child", DependencyType::OneCancelsOther);

  complete("parent");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Acknowledged);
  std::lock_guard lock(mutex);
  ASSERT_EQ(venue_cancels.size(), 1u);
  EXPECT_EQ(venue_cancels[0], "child");
}

TEST_F(OrderDependencyManagerTest, OcoIgnoresParentCancellation) {
  create("parent");
  create("child");
  deps.createDependency("parent", "child", DependencyType::OneCancelsOther);

  lifecycles.transitionState("parent", LifecycleState::Cancelled,
                             "ORDER_CANCELLED");
  ASSERT_TRUE(deps.waitForIdle());

  EXPECT_EQ(stateOf("child"), LifecycleState::Created);
}

// =============================================================================
// order_monitor_test.cpp
// =============================================================================
// Unit tests for orex::OrderMonitor.
//
// Validates:
//   - DELAYED once an order sits in Submitted/Cancelling past the threshold
//   - PARTIAL_FILL once a partial fill stops progressing
//   - PRICE_DEVIATION for limit orders filled away from their price
//   - One open alert per (order, type); acknowledging re-arms the check
//   - Alerts disappear with their order's terminal transition
//   - The sink receives each new alert exactly once
// =============================================================================

#include "orex/errors/execution_error.hpp"
#include "orex/monitoring/order_monitor.hpp"
#include "orex/time/simulation_time_provider.hpp"

#include "support/order_builders.hpp"
#include "support/recording_logger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using orex::AlertType;
using orex::ErrorCode;
using orex::ExecutionError;
using orex::OrderMonitor;
using orex::domain::LifecycleState;
using orex::testing::makeOrder;

namespace {

orex::MonitoringConfig thresholds() {
  orex::MonitoringConfig c;
  c.delay_threshold = std::chrono::milliseconds(1'000);
  c.partial_fill_threshold = std::chrono::milliseconds(5'000);
  c.price_deviation_pct = 2.0;
  return c;
}

}  // namespace

class OrderMonitorTest : public ::testing::Test {
 protected:
  void submit(const std::string& id) {
    lifecycles.createLifecycle(makeOrder(id));
    lifecycles.transitionState(id, LifecycleState::Validated,
                               "VALIDATION_PASSED");
    lifecycles.transitionState(id, LifecycleState::Submitted,
                               "ORDER_SUBMITTED");
  }

  void partFill(const std::string& id, std::int64_t qty, double price) {
    lifecycles.transitionState(id, LifecycleState::Acknowledged,
                               "ORDER_ACKNOWLEDGED");
    lifecycles.transitionState(
        id, LifecycleState::PartiallyFilled, "ORDER_PARTIALLY_FILLED", {},
        [&](orex::domain::Order& o) {
          o.filled_quantity = qty;
          o.average_price = price;
        });
  }

  orex::SimulationTimeProvider clock{50'000};
  orex::testing::RecordingLogger logger;
  orex::OrderLifecycleManager lifecycles{clock, logger};
  OrderMonitor monitor{thresholds(), lifecycles, clock, logger};
};

TEST_F(OrderMonitorTest, SubmittedWithoutAnswerIsDelayed) {
  submit("ord-1");

  clock.advance_by(1'000);
  EXPECT_TRUE(monitor.scan().empty());

  clock.advance_by(1);
  auto raised = monitor.scan();
  ASSERT_EQ(raised.size(), 1u);
  EXPECT_EQ(raised[0].type, AlertType::Delayed);
  EXPECT_EQ(raised[0].order_id, "ord-1");
  EXPECT_EQ(raised[0].created_at_ms, 51'001);
  EXPECT_EQ(raised[0].message,
            "Order ord-1 has had no venue response for 1001ms in state "
            "SUBMITTED");
  EXPECT_TRUE(logger.contains("order alert raised"));
}

TEST_F(OrderMonitorTest, AcknowledgedOrdersAreNotDelayed) {
  submit("ord-1");
  lifecycles.transitionState("ord-1", LifecycleState::Acknowledged,
                             "ORDER_ACKNOWLEDGED");
  clock.advance_by(10'000);
  EXPECT_TRUE(monitor.scan().empty());
}

TEST_F(OrderMonitorTest, OpenAlertIsNotRaisedTwice) {
  submit("ord-1");
  std::vector<std::string> sunk;
  monitor.setAlertSink(
      [&](const orex::OrderAlert& alert) { sunk.push_back(alert.order_id); });

  clock.advance_by(2'000);
  EXPECT_EQ(monitor.scan().size(), 1u);
  clock.advance_by(2'000);
  EXPECT_TRUE(monitor.scan().empty());
  EXPECT_EQ(sunk, std::vector<std::string>{"ord-1"});

  monitor.acknowledge("ord-1", AlertType::Delayed);
  EXPECT_TRUE(monitor.activeAlerts().empty());

  // Still stuck, so the check fires again once acknowledged.
  EXPECT_EQ(monitor.scan().size(), 1u);
  EXPECT_EQ(monitor.alertsFor("ord-1").size(), 2u);
  EXPECT_EQ(sunk.size(), 2u);
}

TEST_F(OrderMonitorTest, StalledPartialFillAndPriceDeviation) {
  submit("ord-1");
  partFill("ord-1", 4, 103.0);

  // Limit 100.00 filled at 103.00 is 3% away.
  auto raised = monitor.scan();
  ASSERT_EQ(raised.size(), 1u);
  EXPECT_EQ(raised[0].type, AlertType::PriceDeviation);
  EXPECT_EQ(raised[0].message,
            "Order ord-1 has price deviation of 3.00%. Expected: 100.00, "
            "Actual: 103.00");

  clock.advance_by(5'001);
  raised = monitor.scan();
  ASSERT_EQ(raised.size(), 1u);
  EXPECT_EQ(raised[0].type, AlertType::PartialFill);
  EXPECT_EQ(raised[0].message,
            "Order ord-1 is partially filled for too long. Filled: 4/10, idle "
            "5001ms");
  EXPECT_EQ(monitor.activeAlerts().size(), 2u);
}

TEST_F(OrderMonitorTest, MarketOrdersHaveNoPriceDeviation) {
  auto order = makeOrder("ord-m");
  order.order_type = orex::domain::OrderType::Market;
  order.price = 0.0;
  lifecycles.createLifecycle(order);
  lifecycles.transitionState("ord-m", LifecycleState::Validated, "V");
  lifecycles.transitionState("ord-m", LifecycleState::Submitted, "S");
  partFill("ord-m", 2, 250.0);
  EXPECT_TRUE(monitor.scan().empty());
}

TEST_F(OrderMonitorTest, TerminalOrdersDropTheirAlerts) {
  submit("ord-1");
  clock.advance_by(2'000);
  ASSERT_EQ(monitor.scan().size(), 1u);

  lifecycles.transitionState("ord-1", LifecycleState::Cancelled,
                             "ORDER_CANCELLED");
  EXPECT_TRUE(monitor.scan().empty());
  EXPECT_TRUE(monitor.alertsFor("ord-1").empty());
  EXPECT_TRUE(monitor.activeAlerts().empty());
}

TEST_F(OrderMonitorTest, AcknowledgeUnknownAlertIsNotFound) {
  submit("ord-1");
  try {
    monitor.acknowledge("ord-1", AlertType::PartialFill);
    FAIL() << "acknowledged an alert that was never raised";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::OrderNotFound);
    EXPECT_EQ(e.message(), "No unacknowledged PARTIAL_FILL alert for order ord-1");
  }
}

TEST_F(OrderMonitorTest, DisabledChecksAndSpellings) {
  orex::MonitoringConfig off;
  off.delay_threshold = std::chrono::milliseconds(0);
  off.partial_fill_threshold = std::chrono::milliseconds(0);
  off.price_deviation_pct = 0.0;
  OrderMonitor quiet(off, lifecycles, clock, logger);
  submit("ord-1");
  clock.advance_by(100'000);
  EXPECT_TRUE(quiet.scan().empty());

  auto parsed = orex::parseAlertType("PRICE_DEVIATION");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, AlertType::PriceDeviation);
  EXPECT_FALSE(orex::parseAlertType("late").has_value());

  off.price_deviation_pct = -1.0;
  EXPECT_THROW(OrderMonitor(off, lifecycles, clock, logger), ExecutionError);
}

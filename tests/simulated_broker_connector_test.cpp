// =============================================================================
// simulated_broker_connector_test.cpp
// =============================================================================
// Unit tests for orex::SimulatedBrokerConnector and the connector factory.
//
// Validates:
//   - Session rules: connect before login, login before trading
//   - "auto" fill mode reports OPEN then FILLED on the report thread
//   - "none" fill mode stays silent until fill() drives it
//   - Cancel, modify and status against the simulated book
//   - Venue-side rejection of configured symbols
//   - Positions, holdings and dealer-scoped views
//   - Factory: default creators, unsupported types, params parsing
// =============================================================================

#include "orex/broker/broker_connector_factory.hpp"
#include "orex/broker/simulated_broker_connector.hpp"
#include "orex/time/simulation_time_provider.hpp"

#include "support/order_builders.hpp"
#include "support/recording_logger.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using orex::ErrorCode;
using orex::ExecutionError;
using orex::SimulatedBrokerConnector;
using orex::domain::OrderStatus;
using orex::testing::makeOrder;

class SimulatedBrokerConnectorTest : public ::testing::Test {
 protected:
  std::unique_ptr<SimulatedBrokerConnector> makeVenue(
      SimulatedBrokerConnector::FillMode mode,
      bool dealer = false) {
    SimulatedBrokerConnector::Options options;
    options.fill_mode = mode;
    options.latency = 0ms;
    options.dealer = dealer;
    options.reject_symbols = {"HALTED"};
    auto venue = std::make_unique<SimulatedBrokerConnector>("SIM01", options,
                                                            clock, logger);
    venue->setExecutionReportHandler(
        [this](const orex::domain::ExecutionReport& report) {
          std::lock_guard lock(mutex);
          reports.push_back(report);
        });
    return venue;
  }

  void openSession(SimulatedBrokerConnector& venue) {
    venue.connect(ctx);
    orex::domain::Credentials credentials;
    credentials.user_id = "desk-1";
    venue.login(credentials, ctx);
  }

  std::vector<orex::domain::ExecutionReport> received() {
    std::lock_guard lock(mutex);
    return reports;
  }

  orex::SimulationTimeProvider clock{50'000};
  orex::testing::RecordingLogger logger;
  orex::CallContext ctx;

  std::mutex mutex;
  std::vector<orex::domain::ExecutionReport> reports;
};

// -----------------------------------------------------------------------------
// 1. Sessions
// -----------------------------------------------------------------------------
TEST_F(SimulatedBrokerConnectorTest, LoginRequiresConnection) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  orex::domain::Credentials credentials;
  credentials.user_id = "desk-1";

  try {
    venue->login(credentials, ctx);
    FAIL() << "login without connect succeeded";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NotConnected);
    EXPECT_EQ(e.type(), orex::ErrorType::Network);
  }

  venue->connect(ctx);
  auto session = venue->login(credentials, ctx);
  EXPECT_EQ(session.user_id, "desk-1");
  EXPECT_EQ(session.client_id, "SIM01");
  EXPECT_EQ(session.expires_at_ms, 50'000 + 8 * 60 * 60 * 1000);
}

TEST_F(SimulatedBrokerConnectorTest, TradingRequiresLogin) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  venue->connect(ctx);
  try {
    venue->placeOrder(makeOrder("ord-1"), ctx);
    FAIL() << "order accepted without session";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::AuthenticationFailed);
  }

  orex::domain::Credentials anonymous;
  EXPECT_THROW(venue->login(anonymous, ctx), ExecutionError);
}

TEST_F(SimulatedBrokerConnectorTest, DisconnectDropsSession) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);
  venue->disconnect();
  EXPECT_FALSE(venue->isConnected());

  venue->connect(ctx);
  EXPECT_THROW(venue->placeOrder(makeOrder("ord-1"), ctx), ExecutionError);
}

// -----------------------------------------------------------------------------
// 2. Fill modes
// -----------------------------------------------------------------------------
TEST_F(SimulatedBrokerConnectorTest, AutoModeAcksThenFills) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);

  auto response = venue->placeOrder(makeOrder("ord-1", "INFY", 10, 101.5), ctx);
  EXPECT_EQ(response.order_id, "SIM-1");
  EXPECT_EQ(response.status, OrderStatus::Open);
  ASSERT_TRUE(venue->waitForReports(2s));

  auto got = received();
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].status, OrderStatus::Open);
  EXPECT_EQ(got[0].order_id, "ord-1");
  EXPECT_EQ(got[1].status, OrderStatus::Filled);
  EXPECT_EQ(got[1].filled_quantity, 10);
  EXPECT_DOUBLE_EQ(got[1].fill_price, 101.5);
  EXPECT_EQ(got[1].broker_order_id, "SIM-1");
}

TEST_F(SimulatedBrokerConnectorTest, MarketOrdersFillAtQuotePrice) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);

  auto order = makeOrder("ord-1");
  order.order_type = orex::domain::OrderType::Market;
  order.price = 0.0;
  venue->placeOrder(order, ctx);
  ASSERT_TRUE(venue->waitForReports(2s));

  auto got = received();
  ASSERT_EQ(got.size(), 2u);
  EXPECT_DOUBLE_EQ(got[1].fill_price, 100.0);
}

TEST_F(SimulatedBrokerConnectorTest, ManualFillsAccumulate) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::None);
  openSession(*venue);

  auto response = venue->placeOrder(makeOrder("ord-1", "INFY", 10, 100.0), ctx);
  ASSERT_TRUE(venue->waitForReports(2s));
  EXPECT_TRUE(received().empty());

  venue->fill(response.order_id, 4, 100.0);
  venue->fill(response.order_id, 10, 110.0);
  ASSERT_TRUE(venue->waitForReports(2s));

  auto got = received();
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(got[0].filled_quantity, 4);
  EXPECT_EQ(got[1].status, OrderStatus::Filled);
  EXPECT_EQ(got[1].filled_quantity, 10);
  EXPECT_DOUBLE_EQ(got[1].fill_price, 106.0);

  EXPECT_THROW(venue->fill(response.order_id, 1, 100.0), ExecutionError);
  EXPECT_THROW(venue->fill("SIM-404", 1, 100.0), ExecutionError);
}

// -----------------------------------------------------------------------------
// 3. Cancel, modify, status
// -----------------------------------------------------------------------------
TEST_F(SimulatedBrokerConnectorTest, CancelReportsAndClosesOrder) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::AckOnly);
  openSession(*venue);
  auto placed = venue->placeOrder(makeOrder("ord-1"), ctx);

  auto cancelled = venue->cancelOrder(placed.order_id, ctx);
  EXPECT_EQ(cancelled.status, OrderStatus::Cancelled);
  ASSERT_TRUE(venue->waitForReports(2s));

  auto got = received();
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[1].status, OrderStatus::Cancelled);
  EXPECT_EQ(got[1].order_id, "ord-1");

  try {
    venue->cancelOrder(placed.order_id, ctx);
    FAIL() << "second cancel accepted";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::OrderRejected);
    EXPECT_EQ(e.message(), "order SIM-1 is not open (CANCELLED)");
  }
}

TEST_F(SimulatedBrokerConnectorTest, ModifyUpdatesOpenOrder) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::None);
  openSession(*venue);
  auto placed = venue->placeOrder(makeOrder("ord-1", "INFY", 10, 100.0), ctx);
  venue->fill(placed.order_id, 3, 100.0);

  orex::domain::OrderModification mod;
  mod.price = 99.5;
  mod.quantity = 20;
  venue->modifyOrder(placed.order_id, mod, ctx);

  auto details = venue->getOrderStatus(placed.order_id, ctx);
  EXPECT_DOUBLE_EQ(details.price, 99.5);
  EXPECT_EQ(details.quantity, 20);
  EXPECT_EQ(details.filled_quantity, 3);
  EXPECT_EQ(details.status, OrderStatus::PartiallyFilled);

  orex::domain::OrderModification shrink;
  shrink.quantity = 2;
  EXPECT_THROW(venue->modifyOrder(placed.order_id, shrink, ctx),
               ExecutionError);
  EXPECT_THROW(venue->getOrderStatus("SIM-404", ctx), ExecutionError);
}

TEST_F(SimulatedBrokerConnectorTest, RejectsConfiguredSymbols) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);
  try {
    venue->placeOrder(makeOrder("ord-1", "HALTED"), ctx);
    FAIL() << "halted symbol accepted";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.type(), orex::ErrorType::Validation);
    EXPECT_EQ(e.code(), ErrorCode::OrderRejected);
    EXPECT_EQ(e.orderId(), "ord-1");
  }
  EXPECT_EQ(venue->orderCount(), 0u);
}

TEST_F(SimulatedBrokerConnectorTest, CancelledContextIsHonoured) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);

  auto token = std::make_shared<orex::CancellationToken>();
  token->cancel();
  orex::CallContext cancelled(orex::CallContext::Clock::time_point::max(),
                              token);
  try {
    venue->placeOrder(makeOrder("ord-1"), cancelled);
    FAIL() << "cancelled call reached the book";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::Cancelled);
  }
  EXPECT_EQ(venue->orderCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Book, positions, holdings, quotes
// -----------------------------------------------------------------------------
TEST_F(SimulatedBrokerConnectorTest, FillsBuildPositionsAndHoldings) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);
  venue->placeOrder(makeOrder("ord-1", "INFY", 10, 100.0), ctx);
  auto sell = makeOrder("ord-2", "INFY", 4, 110.0);
  sell.side = orex::domain::Side::Sell;
  venue->placeOrder(sell, ctx);
  ASSERT_TRUE(venue->waitForReports(2s));

  auto positions = venue->getPositions(ctx);
  ASSERT_EQ(positions.size(), 1u);
  EXPECT_EQ(positions[0].net_quantity, 6);
  EXPECT_EQ(positions[0].buy_quantity, 10);
  EXPECT_EQ(positions[0].sell_quantity, 4);

  auto holdings = venue->getHoldings(ctx);
  ASSERT_EQ(holdings.size(), 1u);
  EXPECT_EQ(holdings[0].quantity, 6);

  EXPECT_EQ(venue->getOrderBook(ctx).orders.size(), 2u);
}

TEST_F(SimulatedBrokerConnectorTest, DealerViewsAreScopedToTarget) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto, true);
  ASSERT_NE(venue->dealerOperations(), nullptr);
  openSession(*venue);

  venue->placeDealerOrder("CLIENT7", makeOrder("ord-1"), ctx);
  venue->placeOrder(makeOrder("ord-2"), ctx);
  ASSERT_TRUE(venue->waitForReports(2s));

  auto book = venue->getDealerOrderBook("CLIENT7", ctx);
  ASSERT_EQ(book.orders.size(), 1u);
  EXPECT_EQ(book.orders[0].client_id, "CLIENT7");
  EXPECT_EQ(venue->getDealerPositions("CLIENT7", ctx).size(), 1u);
  EXPECT_EQ(venue->getOrderBook(ctx).orders.size(), 1u);

  auto plain = makeVenue(SimulatedBrokerConnector::FillMode::Auto, false);
  EXPECT_EQ(plain->dealerOperations(), nullptr);
}

TEST_F(SimulatedBrokerConnectorTest, QuotesAndSubscriptions) {
  auto venue = makeVenue(SimulatedBrokerConnector::FillMode::Auto);
  openSession(*venue);

  auto quote = venue->getQuote("TCS", ctx);
  EXPECT_EQ(quote.symbol, "TCS");
  EXPECT_DOUBLE_EQ(quote.last_price, 100.0);
  EXPECT_LT(quote.bid_price, quote.ask_price);

  venue->subscribeQuotes({"TCS", "INFY"}, ctx);
  venue->unsubscribeQuotes({"TCS"}, ctx);
  EXPECT_EQ(venue->subscriptions(), (std::set<std::string>{"INFY"}));
}

// -----------------------------------------------------------------------------
// 5. Factory and params
// -----------------------------------------------------------------------------
TEST(BrokerConnectorFactoryTest, DefaultCreatorsAndUnknownType) {
  orex::SimulationTimeProvider clock{0};
  orex::testing::RecordingLogger logger;
  orex::BrokerConnectorFactory factory;
  orex::registerDefaultConnectors(factory, clock, logger);

  EXPECT_TRUE(factory.supports("simulated"));
  EXPECT_TRUE(factory.supports("zmq_bridge"));
  EXPECT_EQ(factory.types().size(), 2u);

  orex::domain::BrokerConfig config;
  config.type = "simulated";
  config.params = {{"fill_mode", "ack"}, {"dealer", true}};
  auto connector = factory.create("SIM01", config);
  ASSERT_NE(connector, nullptr);
  EXPECT_NE(connector->dealerOperations(), nullptr);

  config.type = "telex";
  try {
    factory.create("OLD01", config);
    FAIL() << "unknown type created";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.message(), "unsupported broker type: telex");
  }
}

TEST(BrokerConnectorFactoryTest, SimulatedParamsParse) {
  auto options = SimulatedBrokerConnector::optionsFromJson(
      {{"fill_mode", "none"},
       {"latency_ms", 0},
       {"reject_symbols", nlohmann::json::array({"HALTED"})},
       {"quote_price", 250.0},
       {"require_login", false}});
  EXPECT_EQ(options.fill_mode, SimulatedBrokerConnector::FillMode::None);
  EXPECT_EQ(options.latency.count(), 0);
  ASSERT_EQ(options.reject_symbols.size(), 1u);
  EXPECT_DOUBLE_EQ(options.quote_price, 250.0);
  EXPECT_FALSE(options.require_login);

  EXPECT_THROW(SimulatedBrokerConnector::optionsFromJson({{"fill_mode", "x"}}),
               ExecutionError);
}

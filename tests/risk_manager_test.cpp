// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for orex::RiskManager and orex::AuditingRiskManager.
//
// Validates:
//   - Order sanity, engine-wide value/position/margin/rate limits
//   - Strategy risk_params (maxOrderValue, maxQuantity, allowedSymbols)
//   - Profile limits referenced through risk_params.riskProfileId
//   - Profile store CRUD and the position book
//   - The auditing decorator logs decisions and normalizes foreign
//     exceptions into System/InternalError
// =============================================================================

#include "orex/errors/error_handler.hpp"
#include "orex/errors/execution_error.hpp"
#include "orex/risk/auditing_risk_manager.hpp"
#include "orex/risk/risk_manager.hpp"
#include "orex/time/simulation_time_provider.hpp"

#include "support/order_builders.hpp"
#include "support/recording_logger.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using orex::ErrorCode;
using orex::ErrorType;
using orex::ExecutionError;
using orex::RiskManager;
using orex::domain::RiskLimit;
using orex::domain::RiskLimitType;
using orex::domain::RiskProfile;
using orex::testing::makeOrder;
using orex::testing::makePortfolio;
using orex::testing::makeStrategy;

namespace {

orex::domain::RiskLimits smallLimits() {
  orex::domain::RiskLimits limits;
  limits.max_position_size = 100;
  limits.max_order_value = 50'000.0;
  limits.max_orders_per_minute = 3;
  limits.intraday_margin_rate = 0.2;
  limits.delivery_margin_rate = 1.0;
  return limits;
}

RiskProfile profileWith(const std::string& id, RiskLimitType type, double value,
                        const std::string& description = "") {
  RiskProfile profile;
  profile.id = id;
  profile.name = id;
  RiskLimit limit;
  limit.type = type;
  limit.value = value;
  limit.description = description;
  profile.limits[type] = limit;
  return profile;
}

// Expects `fn` to throw an ExecutionError with `code`; returns its message.
template <typename Fn>
std::string rejection(ErrorCode code, Fn&& fn) {
  try {
    fn();
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), code) << e.message();
    return e.message();
  }
  ADD_FAILURE() << "expected a rejection";
  return {};
}

}  // namespace

class RiskManagerTest : public ::testing::Test {
 protected:
  orex::SimulationTimeProvider clock{100'000};
  orex::testing::RecordingLogger logger;
  RiskManager risk{smallLimits(), clock, logger};
  orex::domain::Portfolio portfolio = makePortfolio();
  orex::domain::Strategy strategy = makeStrategy();
};

// -----------------------------------------------------------------------------
// 1. Engine-wide checks
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, SmallOrderPasses) {
  EXPECT_NO_THROW(risk.validateOrder(makeOrder("o1"), portfolio, strategy));
}

TEST_F(RiskManagerTest, SanityChecks) {
  auto no_qty = makeOrder("o1", "INFY", 0);
  rejection(ErrorCode::InvalidParameter,
            [&] { risk.validateOrder(no_qty, portfolio, strategy); });

  auto no_symbol = makeOrder("o2", "");
  rejection(ErrorCode::InvalidParameter,
            [&] { risk.validateOrder(no_symbol, portfolio, strategy); });

  auto gtd = makeOrder("o3");
  gtd.validity = orex::domain::Validity::GTD;
  EXPECT_EQ(rejection(ErrorCode::InvalidParameter,
                      [&] { risk.validateOrder(gtd, portfolio, strategy); }),
            "GTD order requires an expiry time");
}

TEST_F(RiskManagerTest, OrderValueCap) {
  auto big = makeOrder("o1", "INFY", 60, 1'000.0);
  EXPECT_EQ(rejection(ErrorCode::InvalidOrder,
                      [&] { risk.validateOrder(big, portfolio, strategy); }),
            "Order value 60000.00 exceeds maximum of 50000.00");
}

TEST_F(RiskManagerTest, PositionLimitUsesProjectedNet) {
  risk.updatePosition("pf-1", "INFY", 95);
  auto buy = makeOrder("o1", "INFY", 10);
  EXPECT_EQ(rejection(ErrorCode::PositionLimitExceeded,
                      [&] { risk.checkPositionLimits(buy, portfolio); }),
            "Position limit exceeded: projected position 105 exceeds limit of "
            "100");

  auto sell = makeOrder("o2", "INFY", 10);
  sell.side = orex::domain::Side::Sell;
  EXPECT_NO_THROW(risk.checkPositionLimits(sell, portfolio));
}

TEST_F(RiskManagerTest, MarginDependsOnProduct) {
  auto poor = makePortfolio(500.0);
  auto delivery = makeOrder("o1", "INFY", 10, 100.0);  // needs 1000
  EXPECT_EQ(rejection(ErrorCode::InsufficientMargin,
                      [&] { risk.checkMarginRequirements(delivery, poor); }),
            "Insufficient margin: required 1000.00, available 500.00");

  auto intraday = delivery;
  intraday.product_type = orex::domain::ProductType::Intraday;  // needs 200
  EXPECT_NO_THROW(risk.checkMarginRequirements(intraday, poor));
}

TEST_F(RiskManagerTest, StopMarketUsesTriggerPrice) {
  auto order = makeOrder("o1", "INFY", 10, 0.0);
  order.order_type = orex::domain::OrderType::StopLossMarket;
  order.trigger_price = 250.0;
  EXPECT_DOUBLE_EQ(RiskManager::orderValue(order), 2'500.0);
}

TEST_F(RiskManagerTest, RateLimitCountsTrailingMinute) {
  for (int i = 0; i < 3; ++i) {
    risk.recordOrder(makeOrder("r" + std::to_string(i)));
  }
  rejection(ErrorCode::RateLimitExceeded,
            [&] { risk.checkRateLimits(makeOrder("o1")); });

  clock.advance_by(RiskManager::kRateWindowMs);
  EXPECT_NO_THROW(risk.checkRateLimits(makeOrder("o2")));
  EXPECT_EQ(risk.getOrderHistory("pf-1").size(), 3u);
}

// -----------------------------------------------------------------------------
// 2. Strategy parameters
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, StrategyParameters) {
  strategy.risk_params = {{"maxQuantity", 5}};
  EXPECT_EQ(rejection(ErrorCode::InvalidOrder,
                      [&] { risk.checkRiskParameters(makeOrder("o1"), strategy); }),
            "Strategy quantity 10 exceeds limit of 5.00");

  strategy.risk_params = {{"allowedSymbols", nlohmann::json::array({"TCS", "WIPRO"})}};
  EXPECT_EQ(rejection(ErrorCode::InvalidOrder,
                      [&] { risk.checkRiskParameters(makeOrder("o1"), strategy); }),
            "Symbol INFY is not allowed for strategy st-1");

  strategy.risk_params = {{"maxOrderValue", 5'000.0}};
  EXPECT_NO_THROW(risk.checkRiskParameters(makeOrder("o1"), strategy));
}

// -----------------------------------------------------------------------------
// 3. Profiles
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ProfileLimitIsApplied) {
  risk.createRiskProfile(profileWith("tight", RiskLimitType::OrderValue, 500.0));
  strategy.risk_params = {{"riskProfileId", "tight"}};

  try {
    risk.validateOrder(makeOrder("o1"), portfolio, strategy);
    FAIL() << "profile limit ignored";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.message(),
              "Maximum order value: order value 1000.00 exceeds limit of "
              "500.00");
    EXPECT_EQ(e.details().at("profileId"), "tight");
    EXPECT_EQ(e.details().at("limitType"), "ORDER_VALUE");
  }
}

TEST_F(RiskManagerTest, ProfileOrderValueLimitDecidesBothWays) {
  orex::domain::RiskLimits wide = smallLimits();
  wide.max_position_size = 10'000;
  wide.max_order_value = 1'000'000.0;
  RiskManager roomy(wide, clock, logger);
  const auto order = makeOrder("o1", "INFY", 1'000, 150.0);

  roomy.createRiskProfile(
      profileWith("desk-small", RiskLimitType::OrderValue, 10'000.0));
  strategy.risk_params = {{"riskProfileId", "desk-small"}};
  EXPECT_EQ(rejection(ErrorCode::InvalidOrder,
                      [&] { roomy.validateOrder(order, portfolio, strategy); }),
            "Maximum order value: order value 150000.00 exceeds limit of "
            "10000.00");

  roomy.createRiskProfile(
      profileWith("desk-large", RiskLimitType::OrderValue, 200'000.0));
  strategy.risk_params = {{"riskProfileId", "desk-large"}};
  EXPECT_NO_THROW(roomy.validateOrder(order, portfolio, strategy));
}

TEST_F(RiskManagerTest, DisabledProfileLimitIsSkipped) {
  auto profile = profileWith("off", RiskLimitType::OrderValue, 1.0);
  profile.limits[RiskLimitType::OrderValue].enabled = false;
  risk.createRiskProfile(profile);
  strategy.risk_params = {{"riskProfileId", "off"}};

  EXPECT_NO_THROW(risk.validateOrder(makeOrder("o1"), portfolio, strategy));
}

TEST_F(RiskManagerTest, DrawdownLimitUsesDescription) {
  risk.createRiskProfile(profileWith("dd", RiskLimitType::Drawdown, 0.10,
                                     "Book drawdown"));
  strategy.risk_params = {{"riskProfileId", "dd"}};
  portfolio.peak_value = 1'000'000.0;
  portfolio.current_value = 800'000.0;

  EXPECT_EQ(rejection(ErrorCode::InvalidOrder,
                      [&] {
                        risk.validateOrder(makeOrder("o1"), portfolio, strategy);
                      }),
            "Book drawdown: drawdown 20.00% exceeds limit of 10.00%");
}

TEST_F(RiskManagerTest, MissingProfileIsRejected) {
  strategy.risk_params = {{"riskProfileId", "nope"}};
  EXPECT_EQ(rejection(ErrorCode::InvalidParameter,
                      [&] {
                        risk.validateOrder(makeOrder("o1"), portfolio, strategy);
                      }),
            "Risk profile with ID nope not found");
}

TEST_F(RiskManagerTest, ProfileStore) {
  auto created =
      risk.createRiskProfile(profileWith("p1", RiskLimitType::Exposure, 1e6));
  EXPECT_EQ(orex::timestamp_to_ms(created.created_at), 100'000);
  EXPECT_THROW(risk.createRiskProfile(created), ExecutionError);
  EXPECT_THROW(risk.createRiskProfile(RiskProfile{}), ExecutionError);

  clock.advance_by(10);
  created.name = "renamed";
  auto updated = risk.updateRiskProfile(created);
  EXPECT_EQ(updated.name, "renamed");
  EXPECT_EQ(orex::timestamp_to_ms(updated.created_at), 100'000);
  EXPECT_EQ(orex::timestamp_to_ms(updated.updated_at), 100'010);

  EXPECT_EQ(risk.listRiskProfiles().size(), 1u);
  risk.deleteRiskProfile("p1");
  EXPECT_THROW(risk.getRiskProfile("p1"), ExecutionError);
  EXPECT_THROW(risk.deleteRiskProfile("p1"), ExecutionError);
}

// -----------------------------------------------------------------------------
// 4. Position book
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, PositionsAccumulateDeltas) {
  EXPECT_EQ(risk.getPosition("pf-1", "INFY").net_quantity, 0);
  risk.updatePosition("pf-1", "INFY", 30);
  auto pos = risk.updatePosition("pf-1", "INFY", -45);
  EXPECT_EQ(pos.net_quantity, -15);
  EXPECT_EQ(risk.getPosition("pf-1", "INFY").net_quantity, -15);
  EXPECT_EQ(risk.getPosition("pf-2", "INFY").net_quantity, 0);
}

// =============================================================================
// AuditingRiskManager
// =============================================================================
namespace {

// Inner manager that fails with a foreign exception type.
class BrokenRiskManager final : public orex::IRiskManager {
 public:
  void validateOrder(const orex::domain::Order&, const orex::domain::Portfolio&,
                     const orex::domain::Strategy&) override {
    throw std::runtime_error("profile store offline");
  }
  void checkPositionLimits(const orex::domain::Order&,
                           const orex::domain::Portfolio&) override {}
  void checkMarginRequirements(const orex::domain::Order&,
                               const orex::domain::Portfolio&) override {}
  void checkRiskParameters(const orex::domain::Order&,
                           const orex::domain::Strategy&) override {}
  void checkRateLimits(const orex::domain::Order&) override {}
  RiskProfile createRiskProfile(const RiskProfile& profile) override {
    return profile;
  }
  RiskProfile getRiskProfile(const std::string&) const override {
    throw std::out_of_range("no such profile");
  }
  RiskProfile updateRiskProfile(const RiskProfile& profile) override {
    return profile;
  }
  void deleteRiskProfile(const std::string&) override {}
  std::vector<RiskProfile> listRiskProfiles() const override { return {}; }
  orex::domain::Position updatePosition(const std::string& portfolio_id,
                                        const std::string& symbol,
                                        std::int64_t delta) override {
    return {portfolio_id, symbol, delta};
  }
  orex::domain::Position getPosition(const std::string& portfolio_id,
                                     const std::string& symbol) const override {
    return {portfolio_id, symbol, 0};
  }
  void recordOrder(const orex::domain::Order&) override {}
  std::vector<orex::domain::Order> getOrderHistory(
      const std::string&) const override {
    return {};
  }
};

}  // namespace

class AuditingRiskManagerTest : public ::testing::Test {
 protected:
  orex::SimulationTimeProvider clock{0};
  orex::testing::RecordingLogger logger;
  orex::DefaultErrorHandler errors{orex::RetryPolicy{}, logger};
};

TEST_F(AuditingRiskManagerTest, LogsPassAndRejection) {
  orex::AuditingRiskManager audited(
      std::make_unique<RiskManager>(smallLimits(), clock, logger), errors,
      logger);

  audited.validateOrder(makeOrder("ok"), makePortfolio(), makeStrategy());
  EXPECT_TRUE(logger.contains("risk check passed"));

  auto big = makeOrder("big", "INFY", 60, 1'000.0);
  EXPECT_THROW(audited.validateOrder(big, makePortfolio(), makeStrategy()),
               ExecutionError);
  EXPECT_TRUE(logger.contains("risk check rejected order"));
}

TEST_F(AuditingRiskManagerTest, ForeignExceptionBecomesInternalError) {
  orex::AuditingRiskManager audited(std::make_unique<BrokenRiskManager>(),
                                    errors, logger);

  try {
    audited.validateOrder(makeOrder("o1"), makePortfolio(), makeStrategy());
    FAIL() << "expected InternalError";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.type(), ErrorType::System);
    EXPECT_EQ(e.code(), ErrorCode::InternalError);
    EXPECT_EQ(e.message(), "validateOrder failed: profile store offline");
  }

  try {
    audited.getRiskProfile("p1");
    FAIL() << "expected InternalError";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e.code(), ErrorCode::InternalError);
  }
  EXPECT_EQ(errors.trackedContexts(), 0u);
}

TEST_F(AuditingRiskManagerTest, DelegatesStoreOperations) {
  orex::AuditingRiskManager audited(
      std::make_unique<RiskManager>(smallLimits(), clock, logger), errors,
      logger);

  audited.createRiskProfile(profileWith("p1", RiskLimitType::Leverage, 2.0));
  EXPECT_EQ(audited.getRiskProfile("p1").id, "p1");
  EXPECT_EQ(audited.updatePosition("pf-1", "TCS", 7).net_quantity, 7);
  EXPECT_EQ(audited.getPosition("pf-1", "TCS").net_quantity, 7);
  EXPECT_THROW(audited.getRiskProfile("missing"), ExecutionError);
}

#pragma once

#include "orex/domain/broker_types.hpp"
#include "orex/domain/order.hpp"
#include "orex/domain/order_dependency.hpp"
#include "orex/domain/order_lifecycle.hpp"
#include "orex/domain/portfolio.hpp"
#include "orex/domain/risk_limits.hpp"
#include "orex/domain/risk_profile.hpp"

#include <nlohmann/json.hpp>

namespace orex {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for domain records
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json ADL hooks so domain values convert with
//         `nlohmann::json j = order;` and `j.get<Order>()`.
//
// @details
// Wire conventions (shared by the control plane, the bridge connector and
// the engine snapshot):
//   - snake_case keys
//   - enums as their upper-case wire names (toString / parse*)
//   - timestamps as integer epoch milliseconds ("created_at_ms")
//
// from_json is lenient about optional fields (missing → default) but
// strict about identity fields and enum spellings. An unknown enum value
// throws ExecutionError Validation/InvalidParameter naming the field; a
// missing required key or wrong JSON type surfaces as the usual
// nlohmann::json::exception.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const OrderEvent& event);
void to_json(nlohmann::json& j, const OrderLifecycle& lifecycle);
void to_json(nlohmann::json& j, const OrderDependency& dependency);

void to_json(nlohmann::json& j, const RiskLimit& limit);
void from_json(const nlohmann::json& j, RiskLimit& limit);
void to_json(nlohmann::json& j, const RiskProfile& profile);
void from_json(const nlohmann::json& j, RiskProfile& profile);

void to_json(nlohmann::json& j, const BrokerConfig& config);
void from_json(const nlohmann::json& j, BrokerConfig& config);
void to_json(nlohmann::json& j, const Credentials& credentials);
void from_json(const nlohmann::json& j, Credentials& credentials);
void to_json(nlohmann::json& j, const Session& session);
void from_json(const nlohmann::json& j, Session& session);
void to_json(nlohmann::json& j, const BrokerOrderResponse& response);
void from_json(const nlohmann::json& j, BrokerOrderResponse& response);
void to_json(nlohmann::json& j, const OrderModification& modification);
void to_json(nlohmann::json& j, const BrokerOrderDetails& details);
void from_json(const nlohmann::json& j, BrokerOrderDetails& details);
void to_json(nlohmann::json& j, const OrderBook& book);
void from_json(const nlohmann::json& j, OrderBook& book);
void to_json(nlohmann::json& j, const BrokerPosition& position);
void from_json(const nlohmann::json& j, BrokerPosition& position);
void to_json(nlohmann::json& j, const Holding& holding);
void from_json(const nlohmann::json& j, Holding& holding);
void to_json(nlohmann::json& j, const Quote& quote);
void from_json(const nlohmann::json& j, Quote& quote);
void to_json(nlohmann::json& j, const ExecutionReport& report);
void from_json(const nlohmann::json& j, ExecutionReport& report);

void to_json(nlohmann::json& j, const Portfolio& portfolio);
void from_json(const nlohmann::json& j, Portfolio& portfolio);
void to_json(nlohmann::json& j, const Strategy& strategy);
void from_json(const nlohmann::json& j, Strategy& strategy);
void to_json(nlohmann::json& j, const Position& position);

// Every key optional; missing keys keep the RiskLimits defaults.
void to_json(nlohmann::json& j, const RiskLimits& limits);
void from_json(const nlohmann::json& j, RiskLimits& limits);

}  // namespace domain
}  // namespace orex

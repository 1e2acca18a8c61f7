#include "orex/domain/broker_types.hpp"
#include "orex/domain/order.hpp"
#include "orex/domain/order_dependency.hpp"
#include "orex/domain/order_lifecycle.hpp"
#include "orex/domain/risk_profile.hpp"

#include <array>
#include <utility>

namespace orex {
namespace domain {

namespace {

// Reverse lookup over a small name table. The tables below are the single
// source of truth for both directions.
template <typename E, std::size_t N>
std::optional<E> lookup(const std::array<std::pair<E, const char*>, N>& table,
                        std::string_view text) {
  for (const auto& [value, name] : table) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename E, std::size_t N>
const char* nameOf(const std::array<std::pair<E, const char*>, N>& table,
                   E value) {
  for (const auto& [v, name] : table) {
    if (v == value) {
      return name;
    }
  }
  return "UNKNOWN";
}

const std::array<std::pair<Side, const char*>, 2> kSides{{
    {Side::Buy, "BUY"},
    {Side::Sell, "SELL"},
}};

const std::array<std::pair<OrderType, const char*>, 4> kOrderTypes{{
    {OrderType::Market, "MARKET"},
    {OrderType::Limit, "LIMIT"},
    {OrderType::StopLoss, "SL"},
    {OrderType::StopLossMarket, "SL-M"},
}};

const std::array<std::pair<ProductType, const char*>, 3> kProductTypes{{
    {ProductType::Intraday, "MIS"},
    {ProductType::Normal, "NRML"},
    {ProductType::Delivery, "CNC"},
}};

const std::array<std::pair<Validity, const char*>, 4> kValidities{{
    {Validity::Day, "DAY"},
    {Validity::IOC, "IOC"},
    {Validity::GTC, "GTC"},
    {Validity::GTD, "GTD"},
}};

const std::array<std::pair<OrderStatus, const char*>, 9> kOrderStatuses{{
    {OrderStatus::New, "NEW"},
    {OrderStatus::Pending, "PENDING"},
    {OrderStatus::Open, "OPEN"},
    {OrderStatus::PartiallyFilled, "PARTIALLY_FILLED"},
    {OrderStatus::Filled, "FILLED"},
    {OrderStatus::Cancelled, "CANCELLED"},
    {OrderStatus::Rejected, "REJECTED"},
    {OrderStatus::Expired, "EXPIRED"},
    {OrderStatus::Failed, "FAILED"},
}};

const std::array<std::pair<LifecycleState, const char*>, 11> kLifecycleStates{{
    {LifecycleState::Created, "CREATED"},
    {LifecycleState::Validated, "VALIDATED"},
    {LifecycleState::Submitted, "SUBMITTED"},
    {LifecycleState::Acknowledged, "ACKNOWLEDGED"},
    {LifecycleState::PartiallyFilled, "PARTIALLY_FILLED"},
    {LifecycleState::Completed, "COMPLETED"},
    {LifecycleState::Cancelling, "CANCELLING"},
    {LifecycleState::Cancelled, "CANCELLED"},
    {LifecycleState::Rejected, "REJECTED"},
    {LifecycleState::Expired, "EXPIRED"},
    {LifecycleState::Failed, "FAILED"},
}};

const std::array<std::pair<DependencyType, const char*>, 2> kDependencyTypes{{
    {DependencyType::OneTriggersOther, "OTO"},
    {DependencyType::OneCancelsOther, "OCO"},
}};

const std::array<std::pair<RiskLimitType, const char*>, 8> kRiskLimitTypes{{
    {RiskLimitType::OrderValue, "ORDER_VALUE"},
    {RiskLimitType::PositionSize, "POSITION_SIZE"},
    {RiskLimitType::Margin, "MARGIN"},
    {RiskLimitType::OrderRate, "ORDER_RATE"},
    {RiskLimitType::Exposure, "EXPOSURE"},
    {RiskLimitType::Leverage, "LEVERAGE"},
    {RiskLimitType::Concentration, "CONCENTRATION"},
    {RiskLimitType::Drawdown, "DRAWDOWN"},
}};

const std::array<std::pair<RiskLevel, const char*>, 4> kRiskLevels{{
    {RiskLevel::Low, "LOW"},
    {RiskLevel::Medium, "MEDIUM"},
    {RiskLevel::High, "HIGH"},
    {RiskLevel::Extreme, "EXTREME"},
}};

}  // namespace

const char* toString(Side side) { return nameOf(kSides, side); }
const char* toString(OrderType type) { return nameOf(kOrderTypes, type); }
const char* toString(ProductType type) { return nameOf(kProductTypes, type); }
const char* toString(Validity validity) {
  return nameOf(kValidities, validity);
}
const char* toString(OrderStatus status) {
  return nameOf(kOrderStatuses, status);
}
const char* toString(LifecycleState state) {
  return nameOf(kLifecycleStates, state);
}
const char* toString(DependencyType type) {
  return nameOf(kDependencyTypes, type);
}
const char* toString(RiskLimitType type) {
  return nameOf(kRiskLimitTypes, type);
}
const char* toString(RiskLevel level) { return nameOf(kRiskLevels, level); }

std::optional<Side> parseSide(std::string_view text) {
  return lookup(kSides, text);
}
std::optional<OrderType> parseOrderType(std::string_view text) {
  return lookup(kOrderTypes, text);
}
std::optional<ProductType> parseProductType(std::string_view text) {
  return lookup(kProductTypes, text);
}
std::optional<Validity> parseValidity(std::string_view text) {
  return lookup(kValidities, text);
}
std::optional<OrderStatus> parseOrderStatus(std::string_view text) {
  return lookup(kOrderStatuses, text);
}
std::optional<LifecycleState> parseLifecycleState(std::string_view text) {
  return lookup(kLifecycleStates, text);
}
std::optional<DependencyType> parseDependencyType(std::string_view text) {
  return lookup(kDependencyTypes, text);
}
std::optional<RiskLimitType> parseRiskLimitType(std::string_view text) {
  return lookup(kRiskLimitTypes, text);
}
std::optional<RiskLevel> parseRiskLevel(std::string_view text) {
  return lookup(kRiskLevels, text);
}

}  // namespace domain
}  // namespace orex

#include "orex/domain/json_codec.hpp"

#include "orex/errors/execution_error.hpp"

#include <string>

namespace orex {
namespace domain {

namespace {

constexpr const char* kSource = "JsonCodec";

using nlohmann::json;

// Missing or null → fallback. Present but misspelled → InvalidParameter.
template <typename E, typename Parser>
E enumField(const json& j, const char* key, Parser parse, E fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  const std::string text = it->get<std::string>();
  auto value = parse(text);
  if (!value) {
    throw ExecutionError::validation(
        ErrorCode::InvalidParameter,
        "unknown " + std::string(key) + " value: " + text, kSource);
  }
  return *value;
}

std::int64_t msOf(Timestamp tp) { return timestamp_to_ms(tp); }

Timestamp timestampField(const json& j, const char* key) {
  return ms_to_timestamp(j.value(key, std::int64_t{0}));
}

}  // namespace

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(json& j, const Order& order) {
  j = json::object();
  j["id"] = order.id;
  j["portfolio_id"] = order.portfolio_id;
  j["strategy_id"] = order.strategy_id;
  j["client_id"] = order.client_id;
  j["symbol"] = order.symbol;
  j["exchange"] = order.exchange;
  j["order_type"] = toString(order.order_type);
  j["product_type"] = toString(order.product_type);
  j["side"] = toString(order.side);
  j["quantity"] = order.quantity;
  j["price"] = order.price;
  j["trigger_price"] = order.trigger_price;
  j["validity"] = toString(order.validity);
  if (order.expires_at) {
    j["expires_at_ms"] = msOf(*order.expires_at);
  }
  if (order.parent_order_id) {
    j["parent_order_id"] = *order.parent_order_id;
  }
  j["status"] = toString(order.status);
  j["filled_quantity"] = order.filled_quantity;
  j["average_price"] = order.average_price;
  j["broker_order_id"] = order.broker_order_id;
  j["created_at_ms"] = msOf(order.created_at);
  j["updated_at_ms"] = msOf(order.updated_at);
}

void from_json(const json& j, Order& order) {
  order.id = j.at("id").get<std::string>();
  order.portfolio_id = j.value("portfolio_id", "");
  order.strategy_id = j.value("strategy_id", "");
  order.client_id = j.value("client_id", "");
  order.symbol = j.value("symbol", "");
  order.exchange = j.value("exchange", "");
  order.order_type =
      enumField(j, "order_type", parseOrderType, OrderType::Limit);
  order.product_type =
      enumField(j, "product_type", parseProductType, ProductType::Delivery);
  order.side = enumField(j, "side", parseSide, Side::Buy);
  order.quantity = j.value("quantity", std::int64_t{0});
  order.price = j.value("price", 0.0);
  order.trigger_price = j.value("trigger_price", 0.0);
  order.validity = enumField(j, "validity", parseValidity, Validity::Day);
  if (j.contains("expires_at_ms") && !j["expires_at_ms"].is_null()) {
    order.expires_at = ms_to_timestamp(j["expires_at_ms"].get<std::int64_t>());
  }
  if (j.contains("parent_order_id") && !j["parent_order_id"].is_null()) {
    order.parent_order_id = j["parent_order_id"].get<std::string>();
  }
  order.status = enumField(j, "status", parseOrderStatus, OrderStatus::New);
  order.filled_quantity = j.value("filled_quantity", std::int64_t{0});
  order.average_price = j.value("average_price", 0.0);
  order.broker_order_id = j.value("broker_order_id", "");
  order.created_at = timestampField(j, "created_at_ms");
  order.updated_at = timestampField(j, "updated_at_ms");
}

// -----------------------------------------------------------------------------
// Lifecycle records (outbound only)
// -----------------------------------------------------------------------------
void to_json(json& j, const OrderEvent& event) {
  j = json::object();
  j["id"] = event.id;
  j["order_id"] = event.order_id;
  if (event.previous_state) {
    j["previous_state"] = toString(*event.previous_state);
  } else {
    j["previous_state"] = nullptr;
  }
  j["state"] = toString(event.state);
  j["event_type"] = event.event_type;
  j["timestamp_ms"] = msOf(event.timestamp);
  j["metadata"] = event.metadata;
}

void to_json(json& j, const OrderLifecycle& lifecycle) {
  j = json::object();
  j["order"] = lifecycle.order;
  j["current_state"] = toString(lifecycle.current_state);
  j["events"] = lifecycle.events;
  j["created_at_ms"] = msOf(lifecycle.created_at);
  j["updated_at_ms"] = msOf(lifecycle.updated_at);
}

void to_json(json& j, const OrderDependency& dependency) {
  j = json::object();
  j["id"] = dependency.id;
  j["parent_order_id"] = dependency.parent_order_id;
  j["child_order_id"] = dependency.child_order_id;
  j["type"] = toString(dependency.type);
  j["condition"] = dependency.condition;
  j["created_at_ms"] = msOf(dependency.created_at);
}

// -----------------------------------------------------------------------------
// Risk profiles
// -----------------------------------------------------------------------------
void to_json(json& j, const RiskLimit& limit) {
  j = json::object();
  j["type"] = toString(limit.type);
  j["value"] = limit.value;
  j["level"] = toString(limit.level);
  j["description"] = limit.description;
  j["enabled"] = limit.enabled;
}

void from_json(const json& j, RiskLimit& limit) {
  const std::string type_text = j.at("type").get<std::string>();
  auto type = parseRiskLimitType(type_text);
  if (!type) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "unknown type value: " + type_text,
                                     kSource);
  }
  limit.type = *type;
  limit.value = j.at("value").get<double>();
  limit.level = enumField(j, "level", parseRiskLevel, RiskLevel::Medium);
  limit.description = j.value("description", "");
  limit.enabled = j.value("enabled", true);
}

void to_json(json& j, const RiskProfile& profile) {
  j = json::object();
  j["id"] = profile.id;
  j["name"] = profile.name;
  j["description"] = profile.description;
  json limits = json::array();
  for (const auto& [type, limit] : profile.limits) {
    limits.push_back(limit);
  }
  j["limits"] = std::move(limits);
  j["created_at_ms"] = msOf(profile.created_at);
  j["updated_at_ms"] = msOf(profile.updated_at);
}

// Limits are a JSON array; a later entry of the same type replaces an
// earlier one.
void from_json(const json& j, RiskProfile& profile) {
  profile.id = j.at("id").get<std::string>();
  profile.name = j.value("name", "");
  profile.description = j.value("description", "");
  profile.limits.clear();
  if (j.contains("limits")) {
    for (const auto& item : j.at("limits")) {
      auto limit = item.get<RiskLimit>();
      profile.limits[limit.type] = limit;
    }
  }
  profile.created_at = timestampField(j, "created_at_ms");
  profile.updated_at = timestampField(j, "updated_at_ms");
}

// -----------------------------------------------------------------------------
// Broker records
// -----------------------------------------------------------------------------
void to_json(json& j, const BrokerConfig& config) {
  j = json::object();
  j["type"] = config.type;
  j["destination"] = config.destination;
  j["params"] = config.params;
}

void from_json(const json& j, BrokerConfig& config) {
  config.type = j.at("type").get<std::string>();
  config.destination = j.value("destination", "");
  config.params = j.value("params", json::object());
}

void to_json(json& j, const Credentials& credentials) {
  j = json::object();
  j["user_id"] = credentials.user_id;
  j["password"] = credentials.password;
  j["api_key"] = credentials.api_key;
  j["api_secret"] = credentials.api_secret;
  j["two_factor_code"] = credentials.two_factor_code;
}

void from_json(const json& j, Credentials& credentials) {
  credentials.user_id = j.value("user_id", "");
  credentials.password = j.value("password", "");
  credentials.api_key = j.value("api_key", "");
  credentials.api_secret = j.value("api_secret", "");
  credentials.two_factor_code = j.value("two_factor_code", "");
}

void to_json(json& j, const Session& session) {
  j = json::object();
  j["token"] = session.token;
  j["user_id"] = session.user_id;
  j["client_id"] = session.client_id;
  j["expires_at_ms"] = session.expires_at_ms;
  j["refresh_token"] = session.refresh_token;
}

void from_json(const json& j, Session& session) {
  session.token = j.value("token", "");
  session.user_id = j.at("user_id").get<std::string>();
  session.client_id = j.value("client_id", "");
  session.expires_at_ms = j.value("expires_at_ms", std::int64_t{0});
  session.refresh_token = j.value("refresh_token", "");
}

void to_json(json& j, const BrokerOrderResponse& response) {
  j = json::object();
  j["order_id"] = response.order_id;
  j["exchange_order_id"] = response.exchange_order_id;
  j["status"] = toString(response.status);
  j["status_message"] = response.status_message;
  j["rejection_reason"] = response.rejection_reason;
}

void from_json(const json& j, BrokerOrderResponse& response) {
  response.order_id = j.at("order_id").get<std::string>();
  response.exchange_order_id = j.value("exchange_order_id", "");
  response.status =
      enumField(j, "status", parseOrderStatus, OrderStatus::Pending);
  response.status_message = j.value("status_message", "");
  response.rejection_reason = j.value("rejection_reason", "");
}

void to_json(json& j, const OrderModification& modification) {
  j = json::object();
  if (modification.price) {
    j["price"] = *modification.price;
  }
  if (modification.quantity) {
    j["quantity"] = *modification.quantity;
  }
  if (modification.trigger_price) {
    j["trigger_price"] = *modification.trigger_price;
  }
}

void to_json(json& j, const BrokerOrderDetails& details) {
  j = json::object();
  j["order_id"] = details.order_id;
  j["exchange_order_id"] = details.exchange_order_id;
  j["client_id"] = details.client_id;
  j["symbol"] = details.symbol;
  j["exchange"] = details.exchange;
  j["side"] = toString(details.side);
  j["order_type"] = toString(details.order_type);
  j["product_type"] = toString(details.product_type);
  j["validity"] = toString(details.validity);
  j["quantity"] = details.quantity;
  j["filled_quantity"] = details.filled_quantity;
  j["price"] = details.price;
  j["trigger_price"] = details.trigger_price;
  j["average_price"] = details.average_price;
  j["status"] = toString(details.status);
  j["status_message"] = details.status_message;
  j["updated_at_ms"] = details.updated_at_ms;
}

void from_json(const json& j, BrokerOrderDetails& details) {
  details.order_id = j.at("order_id").get<std::string>();
  details.exchange_order_id = j.value("exchange_order_id", "");
  details.client_id = j.value("client_id", "");
  details.symbol = j.value("symbol", "");
  details.exchange = j.value("exchange", "");
  details.side = enumField(j, "side", parseSide, Side::Buy);
  details.order_type =
      enumField(j, "order_type", parseOrderType, OrderType::Limit);
  details.product_type =
      enumField(j, "product_type", parseProductType, ProductType::Delivery);
  details.validity = enumField(j, "validity", parseValidity, Validity::Day);
  details.quantity = j.value("quantity", std::int64_t{0});
  details.filled_quantity = j.value("filled_quantity", std::int64_t{0});
  details.price = j.value("price", 0.0);
  details.trigger_price = j.value("trigger_price", 0.0);
  details.average_price = j.value("average_price", 0.0);
  details.status =
      enumField(j, "status", parseOrderStatus, OrderStatus::Pending);
  details.status_message = j.value("status_message", "");
  details.updated_at_ms = j.value("updated_at_ms", std::int64_t{0});
}

void to_json(json& j, const OrderBook& book) {
  j = json::object();
  j["orders"] = book.orders;
}

void from_json(const json& j, OrderBook& book) {
  book.orders = j.value("orders", std::vector<BrokerOrderDetails>{});
}

void to_json(json& j, const BrokerPosition& position) {
  j = json::object();
  j["client_id"] = position.client_id;
  j["symbol"] = position.symbol;
  j["exchange"] = position.exchange;
  j["product_type"] = toString(position.product_type);
  j["net_quantity"] = position.net_quantity;
  j["buy_quantity"] = position.buy_quantity;
  j["sell_quantity"] = position.sell_quantity;
  j["average_price"] = position.average_price;
  j["last_price"] = position.last_price;
  j["realized_pnl"] = position.realized_pnl;
  j["unrealized_pnl"] = position.unrealized_pnl;
}

void from_json(const json& j, BrokerPosition& position) {
  position.client_id = j.value("client_id", "");
  position.symbol = j.at("symbol").get<std::string>();
  position.exchange = j.value("exchange", "");
  position.product_type =
      enumField(j, "product_type", parseProductType, ProductType::Delivery);
  position.net_quantity = j.value("net_quantity", std::int64_t{0});
  position.buy_quantity = j.value("buy_quantity", std::int64_t{0});
  position.sell_quantity = j.value("sell_quantity", std::int64_t{0});
  position.average_price = j.value("average_price", 0.0);
  position.last_price = j.value("last_price", 0.0);
  position.realized_pnl = j.value("realized_pnl", 0.0);
  position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
}

void to_json(json& j, const Holding& holding) {
  j = json::object();
  j["client_id"] = holding.client_id;
  j["symbol"] = holding.symbol;
  j["exchange"] = holding.exchange;
  j["isin"] = holding.isin;
  j["quantity"] = holding.quantity;
  j["average_price"] = holding.average_price;
  j["last_price"] = holding.last_price;
}

void from_json(const json& j, Holding& holding) {
  holding.client_id = j.value("client_id", "");
  holding.symbol = j.at("symbol").get<std::string>();
  holding.exchange = j.value("exchange", "");
  holding.isin = j.value("isin", "");
  holding.quantity = j.value("quantity", std::int64_t{0});
  holding.average_price = j.value("average_price", 0.0);
  holding.last_price = j.value("last_price", 0.0);
}

void to_json(json& j, const Quote& quote) {
  j = json::object();
  j["symbol"] = quote.symbol;
  j["exchange"] = quote.exchange;
  j["last_price"] = quote.last_price;
  j["open"] = quote.open;
  j["high"] = quote.high;
  j["low"] = quote.low;
  j["close"] = quote.close;
  j["volume"] = quote.volume;
  j["bid_price"] = quote.bid_price;
  j["bid_size"] = quote.bid_size;
  j["ask_price"] = quote.ask_price;
  j["ask_size"] = quote.ask_size;
  j["timestamp_ms"] = quote.timestamp_ms;
}

void from_json(const json& j, Quote& quote) {
  quote.symbol = j.at("symbol").get<std::string>();
  quote.exchange = j.value("exchange", "");
  quote.last_price = j.value("last_price", 0.0);
  quote.open = j.value("open", 0.0);
  quote.high = j.value("high", 0.0);
  quote.low = j.value("low", 0.0);
  quote.close = j.value("close", 0.0);
  quote.volume = j.value("volume", std::int64_t{0});
  quote.bid_price = j.value("bid_price", 0.0);
  quote.bid_size = j.value("bid_size", std::int64_t{0});
  quote.ask_price = j.value("ask_price", 0.0);
  quote.ask_size = j.value("ask_size", std::int64_t{0});
  quote.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
}

void to_json(json& j, const ExecutionReport& report) {
  j = json::object();
  j["order_id"] = report.order_id;
  j["broker_order_id"] = report.broker_order_id;
  j["status"] = toString(report.status);
  j["filled_quantity"] = report.filled_quantity;
  j["fill_price"] = report.fill_price;
  j["message"] = report.message;
  j["timestamp_ms"] = report.timestamp_ms;
}

void from_json(const json& j, ExecutionReport& report) {
  report.order_id = j.value("order_id", "");
  report.broker_order_id = j.value("broker_order_id", "");
  report.status = enumField(j, "status", parseOrderStatus, OrderStatus::Open);
  report.filled_quantity = j.value("filled_quantity", std::int64_t{0});
  report.fill_price = j.value("fill_price", 0.0);
  report.message = j.value("message", "");
  report.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
}

// -----------------------------------------------------------------------------
// Portfolio / strategy / limits
// -----------------------------------------------------------------------------
void to_json(json& j, const Portfolio& portfolio) {
  j = json::object();
  j["id"] = portfolio.id;
  j["name"] = portfolio.name;
  j["capital"] = portfolio.capital;
  j["available_margin"] = portfolio.available_margin;
  j["peak_value"] = portfolio.peak_value;
  j["current_value"] = portfolio.current_value;
}

void from_json(const json& j, Portfolio& portfolio) {
  portfolio.id = j.at("id").get<std::string>();
  portfolio.name = j.value("name", "");
  portfolio.capital = j.value("capital", 0.0);
  portfolio.available_margin = j.value("available_margin", 0.0);
  portfolio.peak_value = j.value("peak_value", 0.0);
  portfolio.current_value = j.value("current_value", 0.0);
}

void to_json(json& j, const Strategy& strategy) {
  j = json::object();
  j["id"] = strategy.id;
  j["name"] = strategy.name;
  j["portfolio_id"] = strategy.portfolio_id;
  j["risk_params"] = strategy.risk_params;
}

void from_json(const json& j, Strategy& strategy) {
  strategy.id = j.at("id").get<std::string>();
  strategy.name = j.value("name", "");
  strategy.portfolio_id = j.value("portfolio_id", "");
  strategy.risk_params = j.value("risk_params", json::object());
}

void to_json(json& j, const Position& position) {
  j = json::object();
  j["portfolio_id"] = position.portfolio_id;
  j["symbol"] = position.symbol;
  j["net_quantity"] = position.net_quantity;
}

void to_json(json& j, const RiskLimits& limits) {
  j = json::object();
  j["max_position_size"] = limits.max_position_size;
  j["max_order_value"] = limits.max_order_value;
  j["max_orders_per_minute"] = limits.max_orders_per_minute;
  j["intraday_margin_rate"] = limits.intraday_margin_rate;
  j["normal_margin_rate"] = limits.normal_margin_rate;
  j["delivery_margin_rate"] = limits.delivery_margin_rate;
}

void from_json(const json& j, RiskLimits& limits) {
  limits.max_position_size =
      j.value("max_position_size", limits.max_position_size);
  limits.max_order_value = j.value("max_order_value", limits.max_order_value);
  limits.max_orders_per_minute =
      j.value("max_orders_per_minute", limits.max_orders_per_minute);
  limits.intraday_margin_rate =
      j.value("intraday_margin_rate", limits.intraday_margin_rate);
  limits.normal_margin_rate =
      j.value("normal_margin_rate", limits.normal_margin_rate);
  limits.delivery_margin_rate =
      j.value("delivery_margin_rate", limits.delivery_margin_rate);
}

}  // namespace domain
}  // namespace orex

#pragma once

#include "orex/domain/order.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orex {
namespace domain {

// -----------------------------------------------------------------------------
// BrokerConfig — how to build and reach one broker client
// -----------------------------------------------------------------------------
//   type         connector kind the factory understands ("simulated",
//                "zmq_bridge")
//   destination  venue name used to pick the circuit breaker. Clients that
//                share a venue share a breaker. Empty means "use the client
//                ID".
//   params       connector-specific settings (endpoint, latency, ...)
// -----------------------------------------------------------------------------
struct BrokerConfig {
  std::string type;
  std::string destination;
  nlohmann::json params = nlohmann::json::object();
};

struct Credentials {
  std::string user_id;
  std::string password;
  std::string api_key;
  std::string api_secret;
  std::string two_factor_code;
};

struct Session {
  std::string token;
  std::string user_id;
  std::string client_id;
  std::int64_t expires_at_ms{0};
  std::string refresh_token;
};

struct BrokerOrderResponse {
  std::string order_id;            // venue's identifier for the order
  std::string exchange_order_id;
  OrderStatus status{OrderStatus::Pending};
  std::string status_message;
  std::string rejection_reason;
};

// Fields a modify request may change. Unset fields keep their current value.
struct OrderModification {
  std::optional<double> price;
  std::optional<std::int64_t> quantity;
  std::optional<double> trigger_price;
};

struct BrokerOrderDetails {
  std::string order_id;
  std::string exchange_order_id;
  std::string client_id;
  std::string symbol;
  std::string exchange;
  Side side{Side::Buy};
  OrderType order_type{OrderType::Limit};
  ProductType product_type{ProductType::Delivery};
  Validity validity{Validity::Day};
  std::int64_t quantity{0};
  std::int64_t filled_quantity{0};
  double price{0.0};
  double trigger_price{0.0};
  double average_price{0.0};
  OrderStatus status{OrderStatus::Pending};
  std::string status_message;
  std::int64_t updated_at_ms{0};
};

struct OrderBook {
  std::vector<BrokerOrderDetails> orders;
};

struct BrokerPosition {
  std::string client_id;
  std::string symbol;
  std::string exchange;
  ProductType product_type{ProductType::Delivery};
  std::int64_t net_quantity{0};
  std::int64_t buy_quantity{0};
  std::int64_t sell_quantity{0};
  double average_price{0.0};
  double last_price{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
};

struct Holding {
  std::string client_id;
  std::string symbol;
  std::string exchange;
  std::string isin;
  std::int64_t quantity{0};
  double average_price{0.0};
  double last_price{0.0};
};

struct Quote {
  std::string symbol;
  std::string exchange;
  double last_price{0.0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  std::int64_t volume{0};
  double bid_price{0.0};
  std::int64_t bid_size{0};
  double ask_price{0.0};
  std::int64_t ask_size{0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ExecutionReport — asynchronous venue update for one order
// -----------------------------------------------------------------------------
// filled_quantity is cumulative, not the size of the last fill. fill_price
// is the average price over all fills so far.
// -----------------------------------------------------------------------------
struct ExecutionReport {
  OrderId order_id;
  std::string broker_order_id;
  OrderStatus status{OrderStatus::Open};
  std::int64_t filled_quantity{0};
  double fill_price{0.0};
  std::string message;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace orex

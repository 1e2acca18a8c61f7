#pragma once

#include "orex/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace orex {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Orders arrive from upstream services with opaque string identifiers
// ("ord-20261019-0042"); the engine never mints them.
// -----------------------------------------------------------------------------
using OrderId = std::string;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
  StopLoss,        // stop-limit: trigger_price arms, price limits
  StopLossMarket,  // stop-market: trigger_price arms, executes at market
};

// Margin treatment differs by product: intraday positions are squared off
// the same day and carry a fraction of the notional as margin.
enum class ProductType {
  Intraday,
  Normal,
  Delivery,
};

enum class Validity {
  Day,
  IOC,
  GTC,
  GTD,  // good till date; expires_at must be set
};

// -----------------------------------------------------------------------------
// OrderStatus — externally visible order status
// -----------------------------------------------------------------------------
//
// @details
// Coarser than the lifecycle state machine. Every lifecycle state maps to
// exactly one status (OrderLifecycleManager::toOrderStatus), and the
// lifecycle manager keeps the order snapshot's status in step with its
// state on every transition:
//
//   Created, Validated           → New
//   Submitted, Cancelling        → Pending
//   Acknowledged                 → Open
//   PartiallyFilled              → PartiallyFilled
//   Completed                    → Filled
//   Cancelled / Rejected /
//   Expired / Failed             → same-named status
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,
  Pending,
  Open,
  PartiallyFilled,
  Filled,
  Cancelled,
  Rejected,
  Expired,
  Failed,
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: the caller's order, as it enters the engine.
//
// @details
// Value type. The caller owns its copy; lifecycles keep their own snapshot
// and update status / fill fields on it as transitions happen. Copies that
// leave the engine (lifecycle snapshots, callback arguments) are read-only
// views of one moment.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;                          // immutable identity
  std::string portfolio_id;
  std::string strategy_id;
  std::string client_id;               // broker client the order routes through
  std::string symbol;
  std::string exchange;
  OrderType order_type{OrderType::Limit};
  ProductType product_type{ProductType::Delivery};
  Side side{Side::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  double trigger_price{0.0};
  Validity validity{Validity::Day};
  std::optional<Timestamp> expires_at;   // GTD only
  std::optional<OrderId> parent_order_id;
  OrderStatus status{OrderStatus::New};
  std::int64_t filled_quantity{0};
  double average_price{0.0};
  std::string broker_order_id;         // set once the venue accepts it
  Timestamp created_at{};
  Timestamp updated_at{};
};

// -------------------------------------------------------------------------
// Enum <-> wire strings
// -------------------------------------------------------------------------
// Renderers produce the upper-case wire form ("BUY", "SL-M", "MIS"). The
// parse functions accept that form and return std::nullopt otherwise.
// -------------------------------------------------------------------------
const char* toString(Side side);
const char* toString(OrderType type);
const char* toString(ProductType type);
const char* toString(Validity validity);
const char* toString(OrderStatus status);

std::optional<Side> parseSide(std::string_view text);
std::optional<OrderType> parseOrderType(std::string_view text);
std::optional<ProductType> parseProductType(std::string_view text);
std::optional<Validity> parseValidity(std::string_view text);
std::optional<OrderStatus> parseOrderStatus(std::string_view text);

}  // namespace domain
}  // namespace orex

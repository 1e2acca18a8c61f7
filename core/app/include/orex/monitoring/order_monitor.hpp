#pragma once

#include "orex/domain/order.hpp"
#include "orex/lifecycle/order_lifecycle_manager.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orex {

enum class AlertType {
  Delayed,         // no venue answer after submit or cancel
  PartialFill,     // stuck partially filled
  PriceDeviation,  // limit order filled away from its price
};

const char* toString(AlertType type);
std::optional<AlertType> parseAlertType(std::string_view text);

// Zero disables the corresponding check.
struct MonitoringConfig {
  bool enabled{true};
  std::chrono::milliseconds delay_threshold{30'000};
  std::chrono::milliseconds partial_fill_threshold{60'000};
  double price_deviation_pct{5.0};
};

struct OrderAlert {
  AlertType type{AlertType::Delayed};
  domain::OrderId order_id;
  std::string message;
  std::int64_t created_at_ms{0};
  bool acknowledged{false};
};

nlohmann::json toJson(const OrderAlert& alert);

// -----------------------------------------------------------------------------
// OrderMonitor — stuck and slow order detection
// -----------------------------------------------------------------------------
//
// @brief  Scans the working lifecycles and raises alerts for orders that
//         look stuck at the venue or are filling badly.
//
// @details
// Checks run by scan(), all measured against the lifecycle's last update:
//
//   DELAYED          Submitted or Cancelling for longer than
//                    delay_threshold (the venue never answered)
//   PARTIAL_FILL     PartiallyFilled for longer than partial_fill_threshold
//   PRICE_DEVIATION  Limit order with fills whose average price is more
//                    than price_deviation_pct percent away from its price
//
// An order holds at most one unacknowledged alert per type; a condition
// that persists is not raised again until the earlier alert has been
// acknowledged. Alerts are dropped once their order leaves the working set
// (terminal state).
//
// New alerts are logged at warn and handed to the alert sink after the
// monitor's lock is released.
//
// Thread model: every public method is thread-safe. The engine calls
// scan() from its maintenance thread.
// -----------------------------------------------------------------------------
class OrderMonitor {
 public:
  static constexpr const char* kComponent = "OrderMonitor";

  using AlertSink = std::function<void(const OrderAlert&)>;

  OrderMonitor(MonitoringConfig config, const OrderLifecycleManager& lifecycles,
               const ITimeProvider& clock, ILogger& logger);

  OrderMonitor(const OrderMonitor&) = delete;
  OrderMonitor& operator=(const OrderMonitor&) = delete;

  void setAlertSink(AlertSink sink);

  // Runs one pass. @return alerts raised by this pass, by order ID.
  std::vector<OrderAlert> scan();

  // -------------------------------------------------------------------------
  // acknowledge(order_id, type)
  // -------------------------------------------------------------------------
  // @throws ExecutionError Validation/OrderNotFound
  //         "No unacknowledged <TYPE> alert for order <id>"
  // -------------------------------------------------------------------------
  void acknowledge(const domain::OrderId& order_id, AlertType type);

  // Unacknowledged alerts, by order ID then creation time.
  std::vector<OrderAlert> activeAlerts() const;

  // Every retained alert for one order, oldest first.
  std::vector<OrderAlert> alertsFor(const domain::OrderId& order_id) const;

  const MonitoringConfig& config() const { return config_; }

 private:
  // Caller holds mutex_. @return false if an open alert of that type exists.
  bool raiseLocked(const OrderAlert& alert);

  const MonitoringConfig config_;
  const OrderLifecycleManager& lifecycles_;
  const ITimeProvider& clock_;
  ILogger& logger_;

  mutable std::mutex mutex_;
  std::map<domain::OrderId, std::vector<OrderAlert>> alerts_;

  std::mutex sink_mutex_;
  AlertSink sink_;
};

}  // namespace orex

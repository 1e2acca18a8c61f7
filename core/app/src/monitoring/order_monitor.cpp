#include "orex/monitoring/order_monitor.hpp"

#include "orex/errors/execution_error.hpp"
#include "orex/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <set>
#include <sstream>
#include <utility>

namespace orex {

using domain::LifecycleState;

namespace {

std::string fixed2(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

const char* toString(AlertType type) {
  switch (type) {
    case AlertType::Delayed:        return "DELAYED";
    case AlertType::PartialFill:    return "PARTIAL_FILL";
    case AlertType::PriceDeviation: return "PRICE_DEVIATION";
  }
  return "UNKNOWN";
}

std::optional<AlertType> parseAlertType(std::string_view text) {
  for (AlertType type : {AlertType::Delayed, AlertType::PartialFill,
                         AlertType::PriceDeviation}) {
    if (text == toString(type)) {
      return type;
    }
  }
  return std::nullopt;
}

nlohmann::json toJson(const OrderAlert& alert) {
  nlohmann::json j;
  j["type"] = toString(alert.type);
  j["order_id"] = alert.order_id;
  j["message"] = alert.message;
  j["created_at_ms"] = alert.created_at_ms;
  j["acknowledged"] = alert.acknowledged;
  return j;
}

OrderMonitor::OrderMonitor(MonitoringConfig config,
                           const OrderLifecycleManager& lifecycles,
                           const ITimeProvider& clock, ILogger& logger)
    : config_(config), lifecycles_(lifecycles), clock_(clock), logger_(logger) {
  if (config_.delay_threshold.count() < 0 ||
      config_.partial_fill_threshold.count() < 0 ||
      config_.price_deviation_pct < 0.0) {
    throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                     "monitoring thresholds must not be negative",
                                     kComponent);
  }
}

void OrderMonitor::setAlertSink(AlertSink sink) {
  std::lock_guard lock(sink_mutex_);
  sink_ = std::move(sink);
}

// -----------------------------------------------------------------------------
// scan(): one pass over the working set
// -----------------------------------------------------------------------------
std::vector<OrderAlert> OrderMonitor::scan() {
  const std::int64_t now = clock_.now_ms();
  const auto working = lifecycles_.getActiveLifecycles();

  std::vector<OrderAlert> raised;
  {
    std::lock_guard lock(mutex_);

    std::set<domain::OrderId> live;
    for (const auto& lc : working) {
      live.insert(lc.order.id);
    }
    for (auto it = alerts_.begin(); it != alerts_.end();) {
      it = live.count(it->first) == 0 ? alerts_.erase(it) : std::next(it);
    }

    for (const auto& lc : working) {
      const domain::Order& order = lc.order;
      const std::int64_t idle = now - timestamp_to_ms(lc.updated_at);
      const auto raise = [&](AlertType type, std::string message) {
        OrderAlert alert;
        alert.type = type;
        alert.order_id = order.id;
        alert.message = std::move(message);
        alert.created_at_ms = now;
        if (raiseLocked(alert)) {
          raised.push_back(std::move(alert));
        }
      };

      const bool awaiting_venue = lc.current_state == LifecycleState::Submitted ||
                                  lc.current_state == LifecycleState::Cancelling;
      if (awaiting_venue && config_.delay_threshold.count() > 0 &&
          idle > config_.delay_threshold.count()) {
        raise(AlertType::Delayed,
              "Order " + order.id + " has had no venue response for " +
                  std::to_string(idle) + "ms in state " +
                  domain::toString(lc.current_state));
      }

      if (lc.current_state == LifecycleState::PartiallyFilled &&
          config_.partial_fill_threshold.count() > 0 &&
          idle > config_.partial_fill_threshold.count()) {
        raise(AlertType::PartialFill,
              "Order " + order.id + " is partially filled for too long. Filled: " +
                  std::to_string(order.filled_quantity) + "/" +
                  std::to_string(order.quantity) + ", idle " +
                  std::to_string(idle) + "ms");
      }

      if (config_.price_deviation_pct > 0.0 &&
          order.order_type == domain::OrderType::Limit &&
          order.filled_quantity > 0 && order.price > 0.0) {
        const double deviation =
            std::abs(order.average_price - order.price) / order.price * 100.0;
        if (deviation > config_.price_deviation_pct) {
          raise(AlertType::PriceDeviation,
                "Order " + order.id + " has price deviation of " +
                    fixed2(deviation) + "%. Expected: " + fixed2(order.price) +
                    ", Actual: " + fixed2(order.average_price));
        }
      }
    }
  }

  if (raised.empty()) {
    return raised;
  }

  AlertSink sink;
  {
    std::lock_guard lock(sink_mutex_);
    sink = sink_;
  }
  for (const auto& alert : raised) {
    logger_.warn(kComponent, "order alert raised",
                 {{"orderId", alert.order_id},
                  {"type", toString(alert.type)},
                  {"message", alert.message}});
    if (sink) {
      sink(alert);
    }
  }
  return raised;
}

bool OrderMonitor::raiseLocked(const OrderAlert& alert) {
  auto& history = alerts_[alert.order_id];
  const bool open = std::any_of(
      history.begin(), history.end(), [&](const OrderAlert& existing) {
        return existing.type == alert.type && !existing.acknowledged;
      });
  if (open) {
    return false;
  }
  history.push_back(alert);
  return true;
}

// -----------------------------------------------------------------------------
// acknowledge()
// -----------------------------------------------------------------------------
void OrderMonitor::acknowledge(const domain::OrderId& order_id,
                               AlertType type) {
  {
    std::lock_guard lock(mutex_);
    auto it = alerts_.find(order_id);
    if (it != alerts_.end()) {
      for (auto& alert : it->second) {
        if (alert.type == type && !alert.acknowledged) {
          alert.acknowledged = true;
          logger_.info(kComponent, "alert acknowledged",
                       {{"orderId", order_id}, {"type", toString(type)}});
          return;
        }
      }
    }
  }
  throw ExecutionError::validation(
            ErrorCode::OrderNotFound,
            std::string("No unacknowledged ") + toString(type) +
                " alert for order " + order_id,
            kComponent)
      .withOrderId(order_id);
}

std::vector<OrderAlert> OrderMonitor::activeAlerts() const {
  std::lock_guard lock(mutex_);
  std::vector<OrderAlert> out;
  for (const auto& [order_id, history] : alerts_) {
    for (const auto& alert : history) {
      if (!alert.acknowledged) {
        out.push_back(alert);
      }
    }
  }
  return out;
}

std::vector<OrderAlert> OrderMonitor::alertsFor(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(mutex_);
  auto it = alerts_.find(order_id);
  return it == alerts_.end() ? std::vector<OrderAlert>{} : it->second;
}

}  // namespace orex

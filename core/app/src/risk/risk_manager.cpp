#include "orex/risk/risk_manager.hpp"

#include "orex/errors/execution_error.hpp"

#include <cstdlib>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

namespace orex {

using domain::RiskLimitType;

namespace {

std::string fixed2(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

std::string percent(double fraction) { return fixed2(fraction * 100.0) + "%"; }

ExecutionError breach(ErrorCode code, std::string message,
                      const domain::Order& order) {
  return ExecutionError::validation(code, std::move(message),
                                    RiskManager::kComponent)
      .withOrderId(order.id)
      .withDetails({{"portfolioId", order.portfolio_id},
                    {"strategyId", order.strategy_id},
                    {"symbol", order.symbol}});
}

ExecutionError invalidParameter(std::string message) {
  return ExecutionError::validation(ErrorCode::InvalidParameter,
                                    std::move(message),
                                    RiskManager::kComponent);
}

ExecutionError profileNotFound(const std::string& profile_id) {
  return invalidParameter("Risk profile with ID " + profile_id +
                          " not found");
}

// Prefix used when a limit carries no description of its own.
const char* defaultDescription(RiskLimitType type) {
  switch (type) {
    case RiskLimitType::OrderValue:    return "Maximum order value";
    case RiskLimitType::PositionSize:  return "Maximum position size";
    case RiskLimitType::Margin:        return "Maximum margin";
    case RiskLimitType::OrderRate:     return "Maximum order rate";
    case RiskLimitType::Exposure:      return "Maximum exposure";
    case RiskLimitType::Leverage:      return "Maximum leverage";
    case RiskLimitType::Concentration: return "Maximum concentration";
    case RiskLimitType::Drawdown:      return "Maximum drawdown";
  }
  return "Risk limit";
}

}  // namespace

RiskManager::RiskManager(domain::RiskLimits limits, const ITimeProvider& clock,
                         ILogger& logger)
    : limits_(limits), clock_(clock), logger_(logger) {}

// -----------------------------------------------------------------------------
// Derived quantities
// -----------------------------------------------------------------------------
double RiskManager::referencePrice(const domain::Order& order) {
  return order.order_type == domain::OrderType::StopLossMarket
             ? order.trigger_price
             : order.price;
}

double RiskManager::orderValue(const domain::Order& order) {
  return referencePrice(order) * static_cast<double>(order.quantity);
}

double RiskManager::marginRate(domain::ProductType product) const {
  switch (product) {
    case domain::ProductType::Intraday: return limits_.intraday_margin_rate;
    case domain::ProductType::Normal:   return limits_.normal_margin_rate;
    case domain::ProductType::Delivery: return limits_.delivery_margin_rate;
  }
  return 1.0;
}

std::int64_t RiskManager::projectedPosition(const domain::Order& order) const {
  const std::int64_t current =
      getPosition(order.portfolio_id, order.symbol).net_quantity;
  return order.side == domain::Side::Buy ? current + order.quantity
                                         : current - order.quantity;
}

// -----------------------------------------------------------------------------
// validateOrder(): the full gate
// -----------------------------------------------------------------------------
void RiskManager::validateOrder(const domain::Order& order,
                                const domain::Portfolio& portfolio,
                                const domain::Strategy& strategy) {
  checkSanity(order);

  const double value = orderValue(order);
  if (value > limits_.max_order_value) {
    throw breach(ErrorCode::InvalidOrder,
                 "Order value " + fixed2(value) + " exceeds maximum of " +
                     fixed2(limits_.max_order_value),
                 order);
  }

  checkPositionLimits(order, portfolio);
  checkMarginRequirements(order, portfolio);
  checkRiskParameters(order, strategy);
  checkRateLimits(order);

  auto ref = strategy.risk_params.find("riskProfileId");
  if (ref != strategy.risk_params.end() && ref->is_string() &&
      !ref->get<std::string>().empty()) {
    const domain::RiskProfile profile = getRiskProfile(ref->get<std::string>());
    checkProfileLimits(order, portfolio, profile);
  }
}

void RiskManager::checkSanity(const domain::Order& order) const {
  if (order.symbol.empty()) {
    throw invalidParameter("order symbol is required").withOrderId(order.id);
  }
  if (order.quantity <= 0) {
    throw invalidParameter("order quantity must be positive, got " +
                           std::to_string(order.quantity))
        .withOrderId(order.id);
  }
  if (order.price < 0.0 || order.trigger_price < 0.0) {
    throw invalidParameter("order price must not be negative")
        .withOrderId(order.id);
  }
  if (order.validity == domain::Validity::GTD && !order.expires_at) {
    throw invalidParameter("GTD order requires an expiry time")
        .withOrderId(order.id);
  }
}

// -----------------------------------------------------------------------------
// Engine-wide checks
// -----------------------------------------------------------------------------
void RiskManager::checkPositionLimits(const domain::Order& order,
                                      const domain::Portfolio& /*portfolio*/) {
  const std::int64_t projected = projectedPosition(order);
  if (std::llabs(projected) > limits_.max_position_size) {
    throw breach(ErrorCode::PositionLimitExceeded,
                 "Position limit exceeded: projected position " +
                     std::to_string(projected) + " exceeds limit of " +
                     std::to_string(limits_.max_position_size),
                 order);
  }
}

void RiskManager::checkMarginRequirements(const domain::Order& order,
                                          const domain::Portfolio& portfolio) {
  const double required = orderValue(order) * marginRate(order.product_type);
  if (required > portfolio.available_margin) {
    throw breach(ErrorCode::InsufficientMargin,
                 "Insufficient margin: required " + fixed2(required) +
                     ", available " + fixed2(portfolio.available_margin),
                 order);
  }
}

// -----------------------------------------------------------------------------
// checkRiskParameters(): strategy-level caps in risk_params
// -----------------------------------------------------------------------------
void RiskManager::checkRiskParameters(const domain::Order& order,
                                      const domain::Strategy& strategy) {
  const nlohmann::json& params = strategy.risk_params;
  if (!params.is_object()) {
    return;
  }

  auto max_value = params.find("maxOrderValue");
  if (max_value != params.end() && max_value->is_number()) {
    const double cap = max_value->get<double>();
    const double value = orderValue(order);
    if (value > cap) {
      throw breach(ErrorCode::InvalidOrder,
                   "Strategy order value " + fixed2(value) +
                       " exceeds limit of " + fixed2(cap),
                   order);
    }
  }

  auto max_qty = params.find("maxQuantity");
  if (max_qty != params.end() && max_qty->is_number()) {
    const double cap = max_qty->get<double>();
    if (static_cast<double>(order.quantity) > cap) {
      throw breach(ErrorCode::InvalidOrder,
                   "Strategy quantity " + std::to_string(order.quantity) +
                       " exceeds limit of " + fixed2(cap),
                   order);
    }
  }

  auto allowed = params.find("allowedSymbols");
  if (allowed != params.end() && allowed->is_array() && !allowed->empty()) {
    bool found = false;
    for (const auto& symbol : *allowed) {
      if (symbol.is_string() && symbol.get<std::string>() == order.symbol) {
        found = true;
        break;
      }
    }
    if (!found) {
      throw breach(ErrorCode::InvalidOrder,
                   "Symbol " + order.symbol + " is not allowed for strategy " +
                       strategy.id,
                   order);
    }
  }
}

void RiskManager::checkRateLimits(const domain::Order& order) {
  const std::size_t count = ordersInWindow(order.portfolio_id);
  if (count >= static_cast<std::size_t>(limits_.max_orders_per_minute)) {
    throw breach(ErrorCode::RateLimitExceeded,
                 "Rate limit exceeded: " + std::to_string(count) +
                     " orders in the last minute, limit " +
                     std::to_string(limits_.max_orders_per_minute),
                 order);
  }
}

std::size_t RiskManager::ordersInWindow(const std::string& portfolio_id) const {
  const std::int64_t cutoff = clock_.now_ms() - kRateWindowMs;
  std::shared_lock lock(history_mutex_);
  auto it = history_.find(portfolio_id);
  if (it == history_.end()) {
    return 0;
  }
  std::size_t count = 0;
  for (auto rit = it->second.rbegin(); rit != it->second.rend(); ++rit) {
    if (rit->recorded_ms <= cutoff) {
      break;
    }
    ++count;
  }
  return count;
}

// -----------------------------------------------------------------------------
// checkProfileLimits(): first enabled breach wins
// -----------------------------------------------------------------------------
void RiskManager::checkProfileLimits(const domain::Order& order,
                                     const domain::Portfolio& portfolio,
                                     const domain::RiskProfile& profile) const {
  const double price = referencePrice(order);
  const double value = orderValue(order);
  const std::int64_t projected = projectedPosition(order);
  const double exposure = static_cast<double>(std::llabs(projected)) * price;

  for (const auto& [type, limit] : profile.limits) {
    if (!limit.enabled) {
      continue;
    }

    std::string detail;
    switch (type) {
      case RiskLimitType::OrderValue:
        if (value > limit.value) {
          detail = "order value " + fixed2(value) + " exceeds limit of " +
                   fixed2(limit.value);
        }
        break;

      case RiskLimitType::PositionSize:
        if (static_cast<double>(std::llabs(projected)) > limit.value) {
          detail = "projected position " + std::to_string(projected) +
                   " exceeds limit of " + fixed2(limit.value);
        }
        break;

      case RiskLimitType::Margin: {
        const double margin = value * marginRate(order.product_type);
        if (margin > limit.value) {
          detail = "required margin " + fixed2(margin) + " exceeds limit of " +
                   fixed2(limit.value);
        }
        break;
      }

      case RiskLimitType::OrderRate: {
        const std::size_t count = ordersInWindow(order.portfolio_id);
        if (static_cast<double>(count) >= limit.value) {
          detail = std::to_string(count) +
                   " orders in the last minute reaches limit of " +
                   fixed2(limit.value);
        }
        break;
      }

      case RiskLimitType::Exposure:
        if (exposure > limit.value) {
          detail = "projected exposure " + fixed2(exposure) +
                   " exceeds limit of " + fixed2(limit.value);
        }
        break;

      case RiskLimitType::Leverage:
        if (portfolio.capital > 0.0) {
          const double leverage = exposure / portfolio.capital;
          if (leverage > limit.value) {
            detail = "leverage " + fixed2(leverage) + "x exceeds limit of " +
                     fixed2(limit.value) + "x";
          }
        }
        break;

      case RiskLimitType::Concentration:
        if (portfolio.current_value > 0.0) {
          const double concentration = exposure / portfolio.current_value;
          if (concentration > limit.value) {
            detail = "concentration " + percent(concentration) +
                     " exceeds limit of " + percent(limit.value);
          }
        }
        break;

      case RiskLimitType::Drawdown:
        if (portfolio.peak_value > 0.0) {
          const double drawdown =
              (portfolio.peak_value - portfolio.current_value) /
              portfolio.peak_value;
          if (drawdown > limit.value) {
            detail = "drawdown " + percent(drawdown) + " exceeds limit of " +
                     percent(limit.value);
          }
        }
        break;
    }

    if (!detail.empty()) {
      const std::string prefix =
          limit.description.empty() ? defaultDescription(type)
                                    : limit.description;
      throw breach(ErrorCode::InvalidOrder, prefix + ": " + detail, order)
          .withDetails({{"profileId", profile.id},
                        {"limitType", domain::toString(type)},
                        {"limitValue", limit.value},
                        {"level", domain::toString(limit.level)}});
    }
  }
}

// -----------------------------------------------------------------------------
// Profile store
// -----------------------------------------------------------------------------
domain::RiskProfile RiskManager::createRiskProfile(
    const domain::RiskProfile& profile) {
  if (profile.id.empty()) {
    throw invalidParameter("Risk profile ID cannot be empty");
  }

  domain::RiskProfile stored = profile;
  const Timestamp ts = ms_to_timestamp(clock_.now_ms());
  stored.created_at = ts;
  stored.updated_at = ts;

  {
    std::unique_lock lock(profiles_mutex_);
    if (profiles_.count(profile.id) != 0) {
      throw invalidParameter("Risk profile with ID " + profile.id +
                             " already exists");
    }
    profiles_.emplace(stored.id, stored);
  }

  logger_.info(kComponent, "risk profile created",
               {{"profileId", stored.id}, {"limits", stored.limits.size()}});
  return stored;
}

domain::RiskProfile RiskManager::getRiskProfile(
    const std::string& profile_id) const {
  std::shared_lock lock(profiles_mutex_);
  auto it = profiles_.find(profile_id);
  if (it == profiles_.end()) {
    throw profileNotFound(profile_id);
  }
  return it->second;
}

domain::RiskProfile RiskManager::updateRiskProfile(
    const domain::RiskProfile& profile) {
  domain::RiskProfile stored = profile;
  {
    std::unique_lock lock(profiles_mutex_);
    auto it = profiles_.find(profile.id);
    if (it == profiles_.end()) {
      throw profileNotFound(profile.id);
    }
    stored.created_at = it->second.created_at;
    stored.updated_at = ms_to_timestamp(clock_.now_ms());
    it->second = stored;
  }

  logger_.info(kComponent, "risk profile updated", {{"profileId", stored.id}});
  return stored;
}

void RiskManager::deleteRiskProfile(const std::string& profile_id) {
  {
    std::unique_lock lock(profiles_mutex_);
    if (profiles_.erase(profile_id) == 0) {
      throw profileNotFound(profile_id);
    }
  }
  logger_.info(kComponent, "risk profile deleted", {{"profileId", profile_id}});
}

std::vector<domain::RiskProfile> RiskManager::listRiskProfiles() const {
  std::shared_lock lock(profiles_mutex_);
  std::vector<domain::RiskProfile> out;
  out.reserve(profiles_.size());
  for (const auto& [id, profile] : profiles_) {
    out.push_back(profile);
  }
  return out;
}

// -----------------------------------------------------------------------------
// Position book
// -----------------------------------------------------------------------------
domain::Position RiskManager::updatePosition(const std::string& portfolio_id,
                                             const std::string& symbol,
                                             std::int64_t quantity_delta) {
  domain::Position position{portfolio_id, symbol, 0};
  {
    std::unique_lock lock(positions_mutex_);
    std::int64_t& net = positions_[portfolio_id][symbol];
    net += quantity_delta;
    position.net_quantity = net;
  }

  logger_.debug(kComponent, "position updated",
                {{"portfolioId", portfolio_id},
                 {"symbol", symbol},
                 {"delta", quantity_delta},
                 {"netQuantity", position.net_quantity}});
  return position;
}

domain::Position RiskManager::getPosition(const std::string& portfolio_id,
                                          const std::string& symbol) const {
  domain::Position position{portfolio_id, symbol, 0};
  std::shared_lock lock(positions_mutex_);
  auto pit = positions_.find(portfolio_id);
  if (pit != positions_.end()) {
    auto sit = pit->second.find(symbol);
    if (sit != pit->second.end()) {
      position.net_quantity = sit->second;
    }
  }
  return position;
}

// -----------------------------------------------------------------------------
// Order history
// -----------------------------------------------------------------------------
void RiskManager::recordOrder(const domain::Order& order) {
  std::unique_lock lock(history_mutex_);
  auto& entries = history_[order.portfolio_id];
  entries.push_back(RecordedOrder{order, clock_.now_ms()});
  while (entries.size() > kMaxHistoryPerPortfolio) {
    entries.pop_front();
  }
}

std::vector<domain::Order> RiskManager::getOrderHistory(
    const std::string& portfolio_id) const {
  std::shared_lock lock(history_mutex_);
  std::vector<domain::Order> out;
  auto it = history_.find(portfolio_id);
  if (it == history_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto& entry : it->second) {
    out.push_back(entry.order);
  }
  return out;
}

}  // namespace orex

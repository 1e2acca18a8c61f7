#pragma once

#include "orex/domain/risk_limits.hpp"
#include "orex/logging/logger.hpp"
#include "orex/risk/i_risk_manager.hpp"
#include "orex/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace orex {

// -----------------------------------------------------------------------------
// RiskManager — rule evaluation, position book, order history
// -----------------------------------------------------------------------------
//
// @brief  Evaluates orders against engine-wide RiskLimits and the risk
//         profile referenced by the strategy.
//
// @details
// validateOrder() runs, in order, stopping at the first breach:
//
//   1. sanity          symbol non-empty, quantity > 0, price >= 0
//   2. order value     price × quantity <= RiskLimits::max_order_value
//   3. checkPositionLimits
//   4. checkMarginRequirements
//   5. checkRiskParameters   (strategy risk_params caps)
//   6. checkRateLimits
//   7. profile limits        every ENABLED limit of the referenced profile,
//                            in RiskLimitType order
//
// Profile breaches read "<limit description>: <detail>", e.g.
//   "Maximum order value: order value 150000.00 exceeds limit of 10000.00"
// and are reported as Validation/InvalidOrder.
//
// Derived quantities:
//   reference price   trigger_price for SL-M orders, price otherwise
//   order value       reference price × quantity
//   projected pos.    current net ± quantity (Buy adds, Sell subtracts)
//   margin            order value × margin rate of the product type
//   exposure          |projected pos.| × reference price
//
// Thread model:
//   Profiles, positions and history are each guarded by a shared_mutex.
//   All public methods are thread-safe.
// -----------------------------------------------------------------------------
class RiskManager final : public IRiskManager {
 public:
  static constexpr const char* kComponent = "RiskManager";
  static constexpr std::int64_t kRateWindowMs = 60'000;
  static constexpr std::size_t kMaxHistoryPerPortfolio = 10'000;

  RiskManager(domain::RiskLimits limits, const ITimeProvider& clock,
              ILogger& logger);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  void validateOrder(const domain::Order& order,
                     const domain::Portfolio& portfolio,
                     const domain::Strategy& strategy) override;

  void checkPositionLimits(const domain::Order& order,
                           const domain::Portfolio& portfolio) override;
  void checkMarginRequirements(const domain::Order& order,
                               const domain::Portfolio& portfolio) override;
  void checkRiskParameters(const domain::Order& order,
                           const domain::Strategy& strategy) override;
  void checkRateLimits(const domain::Order& order) override;

  domain::RiskProfile createRiskProfile(
      const domain::RiskProfile& profile) override;
  domain::RiskProfile getRiskProfile(
      const std::string& profile_id) const override;
  domain::RiskProfile updateRiskProfile(
      const domain::RiskProfile& profile) override;
  void deleteRiskProfile(const std::string& profile_id) override;
  std::vector<domain::RiskProfile> listRiskProfiles() const override;

  domain::Position updatePosition(const std::string& portfolio_id,
                                  const std::string& symbol,
                                  std::int64_t quantity_delta) override;
  domain::Position getPosition(const std::string& portfolio_id,
                               const std::string& symbol) const override;

  void recordOrder(const domain::Order& order) override;
  std::vector<domain::Order> getOrderHistory(
      const std::string& portfolio_id) const override;

  const domain::RiskLimits& limits() const { return limits_; }

  static double referencePrice(const domain::Order& order);
  static double orderValue(const domain::Order& order);
  double marginRate(domain::ProductType product) const;

 private:
  struct RecordedOrder {
    domain::Order order;
    std::int64_t recorded_ms;
  };

  void checkSanity(const domain::Order& order) const;
  void checkProfileLimits(const domain::Order& order,
                          const domain::Portfolio& portfolio,
                          const domain::RiskProfile& profile) const;

  std::int64_t projectedPosition(const domain::Order& order) const;
  std::size_t ordersInWindow(const std::string& portfolio_id) const;

  const domain::RiskLimits limits_;
  const ITimeProvider& clock_;
  ILogger& logger_;

  mutable std::shared_mutex profiles_mutex_;
  std::map<std::string, domain::RiskProfile> profiles_;

  // portfolio → symbol → net quantity
  mutable std::shared_mutex positions_mutex_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::int64_t>>
      positions_;

  mutable std::shared_mutex history_mutex_;
  std::unordered_map<std::string, std::deque<RecordedOrder>> history_;
};

}  // namespace orex

#pragma once

#include "orex/domain/order.hpp"
#include "orex/domain/portfolio.hpp"
#include "orex/domain/risk_profile.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// IRiskManager — pre-trade risk gate and risk-profile store
// -----------------------------------------------------------------------------
//
// @brief  Every check throws ExecutionError on breach and returns normally
//         when the order may proceed. There is no "soft" outcome.
//
// @details
// Two implementations ship:
//   - RiskManager          the rules themselves
//   - AuditingRiskManager  decorator that logs each decision and normalizes
//                          unexpected exceptions
//
// The engine only talks to this interface, so the decorator can be stacked
// without the engine knowing.
//
// Thread-safety contract: implementations MUST be safe to call from any
// thread.
// -----------------------------------------------------------------------------
class IRiskManager {
 public:
  virtual ~IRiskManager() = default;

  // Full gate: sanity, engine-wide limits, then the strategy's profile.
  virtual void validateOrder(const domain::Order& order,
                             const domain::Portfolio& portfolio,
                             const domain::Strategy& strategy) = 0;

  virtual void checkPositionLimits(const domain::Order& order,
                                   const domain::Portfolio& portfolio) = 0;
  virtual void checkMarginRequirements(const domain::Order& order,
                                       const domain::Portfolio& portfolio) = 0;
  virtual void checkRiskParameters(const domain::Order& order,
                                   const domain::Strategy& strategy) = 0;
  virtual void checkRateLimits(const domain::Order& order) = 0;

  virtual domain::RiskProfile createRiskProfile(
      const domain::RiskProfile& profile) = 0;
  virtual domain::RiskProfile getRiskProfile(
      const std::string& profile_id) const = 0;
  virtual domain::RiskProfile updateRiskProfile(
      const domain::RiskProfile& profile) = 0;
  virtual void deleteRiskProfile(const std::string& profile_id) = 0;
  virtual std::vector<domain::RiskProfile> listRiskProfiles() const = 0;

  // Applies a signed quantity change (fills) and returns the new position.
  virtual domain::Position updatePosition(const std::string& portfolio_id,
                                          const std::string& symbol,
                                          std::int64_t quantity_delta) = 0;
  virtual domain::Position getPosition(const std::string& portfolio_id,
                                       const std::string& symbol) const = 0;

  // Feeds the rate limiter and the per-portfolio history.
  virtual void recordOrder(const domain::Order& order) = 0;
  virtual std::vector<domain::Order> getOrderHistory(
      const std::string& portfolio_id) const = 0;
};

}  // namespace orex

#pragma once

#include "orex/errors/error_handler.hpp"
#include "orex/logging/logger.hpp"
#include "orex/risk/i_risk_manager.hpp"

#include <memory>
#include <string>

namespace orex {

// -----------------------------------------------------------------------------
// AuditingRiskManager — logging / normalizing decorator over IRiskManager
// -----------------------------------------------------------------------------
//
// @brief  Forwards every call to the wrapped manager and records the
//         outcome.
//
// @details
// Per call:
//   pass                 info line with order / portfolio / strategy IDs
//   ExecutionError       warn line, rethrown unchanged
//   other std::exception converted to System/InternalError, reported to the
//                        error handler under "risk:<order id>", rethrown as
//                        that ExecutionError
//
// The outcome of a check is never changed: a breach stays a breach and a
// pass stays a pass.
//
// Ownership: owns the wrapped manager. Borrows the error handler and logger.
// -----------------------------------------------------------------------------
class AuditingRiskManager final : public IRiskManager {
 public:
  static constexpr const char* kComponent = "RiskAudit";

  AuditingRiskManager(std::unique_ptr<IRiskManager> inner,
                      IErrorHandler& errors, ILogger& logger);

  AuditingRiskManager(const AuditingRiskManager&) = delete;
  AuditingRiskManager& operator=(const AuditingRiskManager&) = delete;

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

  IRiskManager& inner() { return *inner_; }

 private:
  // Runs one order check and logs its decision.
  template <typename Fn>
  void audit(const char* check, const domain::Order& order, Fn&& fn);

  // Runs a store operation; only failures are logged.
  template <typename Fn>
  auto guard(const char* operation, const std::string& context, Fn&& fn) const
      -> decltype(fn());

  [[noreturn]] void rethrowNormalized(const char* operation,
                                      const std::string& context,
                                      const std::exception& e) const;

  std::unique_ptr<IRiskManager> inner_;
  IErrorHandler& errors_;
  ILogger& logger_;
};

}  // namespace orex

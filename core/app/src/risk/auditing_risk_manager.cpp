#include "orex/risk/auditing_risk_manager.hpp"

#include "orex/errors/execution_error.hpp"

#include <exception>
#include <utility>

namespace orex {

AuditingRiskManager::AuditingRiskManager(std::unique_ptr<IRiskManager> inner,
                                         IErrorHandler& errors,
                                         ILogger& logger)
    : inner_(std::move(inner)), errors_(errors), logger_(logger) {}

// -----------------------------------------------------------------------------
// rethrowNormalized(): report a non-ExecutionError failure as InternalError
// -----------------------------------------------------------------------------
void AuditingRiskManager::rethrowNormalized(const char* operation,
                                            const std::string& context,
                                            const std::exception& e) const {
  ExecutionError normalized =
      ExecutionError::system(ErrorCode::InternalError,
                             std::string(operation) + " failed: " + e.what(),
                             kComponent, std::current_exception());

  const std::string handler_context = "risk:" + context;
  errors_.handleError(handler_context, normalized);
  errors_.releaseContext(handler_context);
  throw normalized;
}

template <typename Fn>
void AuditingRiskManager::audit(const char* check, const domain::Order& order,
                                Fn&& fn) {
  try {
    fn();
  } catch (const ExecutionError& e) {
    logger_.warn(kComponent, "risk check rejected order",
                 {{"check", check},
                  {"orderId", order.id},
                  {"portfolioId", order.portfolio_id},
                  {"strategyId", order.strategy_id},
                  {"code", toString(e.code())},
                  {"reason", e.message()}});
    throw;
  } catch (const std::exception& e) {
    rethrowNormalized(check, order.id, e);
  }

  logger_.info(kComponent, "risk check passed",
               {{"check", check},
                {"orderId", order.id},
                {"portfolioId", order.portfolio_id},
                {"strategyId", order.strategy_id},
                {"symbol", order.symbol},
                {"quantity", order.quantity}});
}

template <typename Fn>
auto AuditingRiskManager::guard(const char* operation,
                                const std::string& context, Fn&& fn) const
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const ExecutionError& e) {
    logger_.warn(kComponent, "risk store operation failed",
                 {{"operation", operation},
                  {"context", context},
                  {"reason", e.message()}});
    throw;
  } catch (const std::exception& e) {
    rethrowNormalized(operation, context, e);
  }
}

// -----------------------------------------------------------------------------
// Order checks
// -----------------------------------------------------------------------------
void AuditingRiskManager::validateOrder(const domain::Order& order,
                                        const domain::Portfolio& portfolio,
                                        const domain::Strategy& strategy) {
  audit("validateOrder", order,
        [&] { inner_->validateOrder(order, portfolio, strategy); });
}

void AuditingRiskManager::checkPositionLimits(
    const domain::Order& order, const domain::Portfolio& portfolio) {
  audit("checkPositionLimits", order,
        [&] { inner_->checkPositionLimits(order, portfolio); });
}

void AuditingRiskManager::checkMarginRequirements(
    const domain::Order& order, const domain::Portfolio& portfolio) {
  audit("checkMarginRequirements", order,
        [&] { inner_->checkMarginRequirements(order, portfolio); });
}

void AuditingRiskManager::checkRiskParameters(
    const domain::Order& order, const domain::Strategy& strategy) {
  audit("checkRiskParameters", order,
        [&] { inner_->checkRiskParameters(order, strategy); });
}

void AuditingRiskManager::checkRateLimits(const domain::Order& order) {
  audit("checkRateLimits", order, [&] { inner_->checkRateLimits(order); });
}

// -----------------------------------------------------------------------------
// Store operations
// -----------------------------------------------------------------------------
domain::RiskProfile AuditingRiskManager::createRiskProfile(
    const domain::RiskProfile& profile) {
  return guard("createRiskProfile", profile.id,
               [&] { return inner_->createRiskProfile(profile); });
}

domain::RiskProfile AuditingRiskManager::getRiskProfile(
    const std::string& profile_id) const {
  return guard("getRiskProfile", profile_id,
               [&] { return inner_->getRiskProfile(profile_id); });
}

domain::RiskProfile AuditingRiskManager::updateRiskProfile(
    const domain::RiskProfile& profile) {
  return guard("updateRiskProfile", profile.id,
               [&] { return inner_->updateRiskProfile(profile); });
}

void AuditingRiskManager::deleteRiskProfile(const std::string& profile_id) {
  guard("deleteRiskProfile", profile_id,
        [&] { inner_->deleteRiskProfile(profile_id); });
}

std::vector<domain::RiskProfile> AuditingRiskManager::listRiskProfiles()
    const {
  return guard("listRiskProfiles", "",
               [&] { return inner_->listRiskProfiles(); });
}

domain::Position AuditingRiskManager::updatePosition(
    const std::string& portfolio_id, const std::string& symbol,
    std::int64_t quantity_delta) {
  return guard("updatePosition", portfolio_id, [&] {
    return inner_->updatePosition(portfolio_id, symbol, quantity_delta);
  });
}

domain::Position AuditingRiskManager::getPosition(
    const std::string& portfolio_id, const std::string& symbol) const {
  return guard("getPosition", portfolio_id,
               [&] { return inner_->getPosition(portfolio_id, symbol); });
}

void AuditingRiskManager::recordOrder(const domain::Order& order) {
  guard("recordOrder", order.id, [&] { inner_->recordOrder(order); });
}

std::vector<domain::Order> AuditingRiskManager::getOrderHistory(
    const std::string& portfolio_id) const {
  return guard("getOrderHistory", portfolio_id,
               [&] { return inner_->getOrderHistory(portfolio_id); });
}

}  // namespace orex

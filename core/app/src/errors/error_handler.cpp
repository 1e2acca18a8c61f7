#include "orex/errors/error_handler.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace orex {

DefaultErrorHandler::DefaultErrorHandler(RetryPolicy policy, ILogger& logger)
    : policy_(policy), logger_(logger), rng_(std::random_device{}()) {}

// -----------------------------------------------------------------------------
// handleError()
// -----------------------------------------------------------------------------
RetryDecision DefaultErrorHandler::handleError(const std::string& context,
                                               const ExecutionError& error) {
  // --- Open breaker: report, do not consume budget ---------------------------
  if (isCircuitOpen(error)) {
    logger_.warn(kComponent, "call short-circuited by open breaker",
                 {{"context", context}, {"error", error.message()}});
    return RetryDecision{false, error, std::chrono::milliseconds{0},
                         attempts(context)};
  }

  // --- Caller gave up: nothing to retry, nothing to count --------------------
  if (isCancelled(error)) {
    logger_.info(kComponent, "call cancelled",
                 {{"context", context}, {"error", error.message()}});
    return RetryDecision{false, error, std::chrono::milliseconds{0},
                         attempts(context)};
  }

  // --- Validation: never retried, surfaced verbatim --------------------------
  if (isValidationError(error)) {
    int attempt = 0;
    {
      std::lock_guard lock(mutex_);
      attempt = ++retry_counts_[context];
    }
    logError(context, error, attempt, false);
    return RetryDecision{false, error, std::chrono::milliseconds{0}, attempt};
  }

  // --- Execution / Network / System: bounded by max_retries ------------------
  int attempt = 0;
  {
    std::lock_guard lock(mutex_);
    attempt = ++retry_counts_[context];
  }
  const bool retry = attempt < policy_.max_retries;

  logError(context, error, attempt, retry);

  ExecutionError reported = error;
  if (error.type() == ErrorType::Network || error.type() == ErrorType::System) {
    // Transport and internal detail stays on the cause for operators; the
    // caller-visible message is generic.
    reported = ExecutionError(error.type(), error.severity(), error.code(),
                              retry ? kGenericRetrying : kGenericFailed,
                              error.source(), std::make_exception_ptr(error))
                   .withOrderId(error.orderId());
  }

  std::chrono::milliseconds delay{0};
  if (retry) {
    delay = retryDelay(attempt);
  }

  return RetryDecision{retry, std::move(reported), delay, attempt};
}

// -----------------------------------------------------------------------------
// releaseContext()
// -----------------------------------------------------------------------------
void DefaultErrorHandler::releaseContext(const std::string& context) {
  std::lock_guard lock(mutex_);
  retry_counts_.erase(context);
}

int DefaultErrorHandler::attempts(const std::string& context) const {
  std::lock_guard lock(mutex_);
  auto it = retry_counts_.find(context);
  return it == retry_counts_.end() ? 0 : it->second;
}

std::size_t DefaultErrorHandler::trackedContexts() const {
  std::lock_guard lock(mutex_);
  return retry_counts_.size();
}

// -----------------------------------------------------------------------------
// retryDelay(): exponential backoff, capped, then jittered
// -----------------------------------------------------------------------------
std::chrono::milliseconds DefaultErrorHandler::retryDelay(int attempt) {
  const int exponent = std::clamp(attempt - 1, 0, 30);
  const double raw = static_cast<double>(policy_.base_retry_delay.count()) *
                     std::pow(2.0, exponent);
  const double capped =
      std::min(raw, static_cast<double>(policy_.max_retry_delay.count()));

  double factor = 1.0;
  if (policy_.jitter > 0.0) {
    std::uniform_real_distribution<double> dist(1.0 - policy_.jitter,
                                                1.0 + policy_.jitter);
    std::lock_guard lock(mutex_);
    factor = dist(rng_);
  }

  return std::chrono::milliseconds{
      static_cast<std::int64_t>(std::llround(capped * factor))};
}

// -----------------------------------------------------------------------------
// logError(): severity follows the error type
// -----------------------------------------------------------------------------
void DefaultErrorHandler::logError(const std::string& context,
                                   const ExecutionError& error, int attempt,
                                   bool will_retry) {
  nlohmann::json fields = {
      {"context", context},
      {"type", toString(error.type())},
      {"code", toString(error.code())},
      {"source", error.source()},
      {"attempt", attempt},
      {"maxRetries", policy_.max_retries},
      {"retry", will_retry},
  };
  if (!error.orderId().empty()) {
    fields["orderId"] = error.orderId();
  }

  switch (error.type()) {
    case ErrorType::Validation:
      fields["message"] = error.message();
      logger_.warn(kComponent, "validation failure", fields);
      break;
    case ErrorType::Execution:
      fields["message"] = error.message();
      logger_.error(kComponent, "execution failure", fields);
      break;
    case ErrorType::Network:
      // Operator logs keep the root cause; the reported error does not.
      fields["cause"] = rootCauseMessage(error);
      logger_.error(kComponent, "network failure", fields);
      break;
    case ErrorType::System:
      fields["cause"] = rootCauseMessage(error);
      logger_.fatal(kComponent, "system failure", fields);
      break;
  }
}

}  // namespace orex

#pragma once

#include "orex/errors/execution_error.hpp"
#include "orex/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace orex {

// -----------------------------------------------------------------------------
// RetryDecision — what the classifier tells the caller to do next
// -----------------------------------------------------------------------------
struct RetryDecision {
  bool should_retry{false};

  // The error the caller should surface. For Validation/Execution this is
  // the original; for Network/System the message is generalized and the
  // original is attached as cause().
  ExecutionError reported;

  // Suggested wait before the next attempt. Zero when should_retry is
  // false. The classifier never sleeps; the orchestrating loop does.
  std::chrono::milliseconds retry_delay{0};

  // 1-based count of handleError() calls seen for this context so far.
  int attempt{0};
};

// -----------------------------------------------------------------------------
// IErrorHandler — error classifier & retry policy capability
// -----------------------------------------------------------------------------
//
// @brief  Classifies an ExecutionError and decides whether the operation
//         identified by `context` may be attempted again.
//
// @details
// `context` is the caller's identity for one logical operation, e.g.
// "placeOrder:ord-42". Every call for the same context counts toward that
// context's budget. Once the budget is spent the answer stays "no" for that
// context until releaseContext() forgets it.
//
// Components never loop on the decision themselves; they return it upward.
// -----------------------------------------------------------------------------
class IErrorHandler {
 public:
  virtual ~IErrorHandler() = default;

  virtual RetryDecision handleError(const std::string& context,
                                    const ExecutionError& error) = 0;

  // Drops the retry counter for a finished operation.
  virtual void releaseContext(const std::string& context) = 0;

  // Retries already consumed by `context` (0 if unknown).
  virtual int attempts(const std::string& context) const = 0;
};

// -----------------------------------------------------------------------------
// RetryPolicy — tunables for DefaultErrorHandler
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_retries{3};
  std::chrono::milliseconds base_retry_delay{100};
  std::chrono::milliseconds max_retry_delay{30'000};

  // Fractional jitter applied symmetrically: 0.2 → delay × [0.8, 1.2].
  double jitter{0.2};
};

// -----------------------------------------------------------------------------
// DefaultErrorHandler
// -----------------------------------------------------------------------------
//
// @brief  Standard classifier: per-context counters, exponential backoff
//         with jitter, severity-aware logging.
//
// @details
// Decision table (n = calls seen for the context, including this one):
//
//   type         retry?                     logged at   reported message
//   ----------   ------------------------   ---------   --------------------------
//   Validation   never                      Warn        original, verbatim
//   Execution    n < max_retries            Error       original, detail kept
//   Network      n < max_retries            Error       "execution failed, retrying"
//                                                       / "execution failed"
//   System       n < max_retries            Fatal       same as Network
//
// CircuitOpen is special-cased: an open breaker is a "service unavailable"
// condition, so it is reported but neither counted against the budget nor
// marked retryable at this layer. The breaker, not the retry loop, decides
// when the venue is worth calling again. Cancelled is handled the same way:
// the caller gave up, so another attempt would only be cancelled again.
//
// With max_retries = 3 the first two calls for a context return
// should_retry = true and the third and later return false.
//
// Backoff:
//   delay = min(max_retry_delay, base_retry_delay × 2^(n-1)) × U(1-j, 1+j)
//
// Thread model: counters are guarded by one mutex. The RNG is guarded by
// the same mutex.
// -----------------------------------------------------------------------------
class DefaultErrorHandler final : public IErrorHandler {
 public:
  static constexpr const char* kComponent = "ErrorHandler";
  static constexpr const char* kGenericRetrying = "execution failed, retrying";
  static constexpr const char* kGenericFailed = "execution failed";

  DefaultErrorHandler(RetryPolicy policy, ILogger& logger);

  DefaultErrorHandler(const DefaultErrorHandler&) = delete;
  DefaultErrorHandler& operator=(const DefaultErrorHandler&) = delete;

  RetryDecision handleError(const std::string& context,
                            const ExecutionError& error) override;

  void releaseContext(const std::string& context) override;

  int attempts(const std::string& context) const override;

  // -------------------------------------------------------------------------
  // retryDelay(attempt)
  // -------------------------------------------------------------------------
  // @brief  Backoff for the given 1-based attempt, jitter included.
  // -------------------------------------------------------------------------
  std::chrono::milliseconds retryDelay(int attempt);

  const RetryPolicy& policy() const { return policy_; }

  std::size_t trackedContexts() const;

 private:
  void logError(const std::string& context, const ExecutionError& error,
                int attempt, bool will_retry);

  const RetryPolicy policy_;
  ILogger& logger_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, int> retry_counts_;
  std::mt19937_64 rng_;
};

}  // namespace orex

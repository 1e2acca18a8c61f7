#pragma once

#include "orex/errors/execution_error.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace orex {

// -----------------------------------------------------------------------------
// CancellationToken — shared "stop what you are doing" flag
// -----------------------------------------------------------------------------
// One token may be shared by many CallContexts (every attempt of one
// submission loop, or every call made while the engine runs). cancel() is
// sticky.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

// -----------------------------------------------------------------------------
// CallContext — deadline + cancellation for one outbound broker call
// -----------------------------------------------------------------------------
//
// @brief  Every call the router makes into a connector carries one of these.
//
// @details
// The deadline is measured on std::chrono::steady_clock, not ITimeProvider:
// it bounds real blocking I/O (a ZeroMQ receive, a simulated latency sleep),
// which a simulated clock cannot shorten.
//
// Connectors are expected to:
//   - check throwIfDone() before starting work,
//   - bound any blocking wait by remaining(),
//   - poll cancelled() while waiting in slices.
//
// Error mapping (see throwIfDone):
//   deadline passed   → Network / ERR_TIMEOUT    retryable, counts as a
//                                                breaker failure
//   token cancelled   → Execution / ERR_CANCELLED not retryable, neutral
//                                                for the breaker
//
// Thread model: immutable after construction except through the shared
// token, which is atomic.
// -----------------------------------------------------------------------------
class CallContext {
 public:
  using Clock = std::chrono::steady_clock;

  // A context with no deadline and its own token.
  CallContext();

  CallContext(Clock::time_point deadline,
              std::shared_ptr<CancellationToken> token);

  static CallContext withTimeout(std::chrono::milliseconds timeout);
  static CallContext withTimeout(std::chrono::milliseconds timeout,
                                 std::shared_ptr<CancellationToken> token);

  bool hasDeadline() const { return deadline_ != Clock::time_point::max(); }
  Clock::time_point deadline() const { return deadline_; }

  bool expired() const;
  bool cancelled() const { return token_ && token_->cancelled(); }

  // Time left before the deadline, clamped at zero. A very large value
  // when there is no deadline.
  std::chrono::milliseconds remaining() const;

  const std::shared_ptr<CancellationToken>& token() const { return token_; }

  // -------------------------------------------------------------------------
  // throwIfDone(source, operation)
  // -------------------------------------------------------------------------
  // @brief  Throws the mapped ExecutionError if the context is cancelled or
  //         past its deadline. Cancellation wins when both hold.
  // -------------------------------------------------------------------------
  void throwIfDone(const std::string& source,
                   const std::string& operation) const;

 private:
  Clock::time_point deadline_;
  std::shared_ptr<CancellationToken> token_;
};

}  // namespace orex

#include "orex/resilience/call_context.hpp"

#include <utility>

namespace orex {

CallContext::CallContext()
    : deadline_(Clock::time_point::max()),
      token_(std::make_shared<CancellationToken>()) {}

CallContext::CallContext(Clock::time_point deadline,
                         std::shared_ptr<CancellationToken> token)
    : deadline_(deadline), token_(std::move(token)) {
  if (!token_) {
    token_ = std::make_shared<CancellationToken>();
  }
}

CallContext CallContext::withTimeout(std::chrono::milliseconds timeout) {
  return withTimeout(timeout, std::make_shared<CancellationToken>());
}

CallContext CallContext::withTimeout(std::chrono::milliseconds timeout,
                                     std::shared_ptr<CancellationToken> token) {
  return CallContext(Clock::now() + timeout, std::move(token));
}

bool CallContext::expired() const {
  return hasDeadline() && Clock::now() >= deadline_;
}

std::chrono::milliseconds CallContext::remaining() const {
  if (!hasDeadline()) {
    return std::chrono::hours(24 * 365);
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline_ - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

// -----------------------------------------------------------------------------
// throwIfDone()
// -----------------------------------------------------------------------------
void CallContext::throwIfDone(const std::string& source,
                              const std::string& operation) const {
  if (cancelled()) {
    throw ExecutionError(ErrorType::Execution, ErrorSeverity::Info,
                         ErrorCode::Cancelled, operation + " cancelled",
                         source);
  }
  if (expired()) {
    throw ExecutionError::network(ErrorCode::Timeout,
                                  operation + " deadline exceeded", source);
  }
}

}  // namespace orex

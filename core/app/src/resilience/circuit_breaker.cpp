#include "orex/resilience/circuit_breaker.hpp"

#include <utility>

namespace orex {

const char* toString(CircuitState state) {
  switch (state) {
    case CircuitState::Closed:   return "CLOSED";
    case CircuitState::Open:     return "OPEN";
    case CircuitState::HalfOpen: return "HALF_OPEN";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config,
                               const ITimeProvider& clock, ILogger& logger)
    : name_(std::move(name)),
      config_(config),
      clock_(clock),
      logger_(logger) {
  if (config_.failure_threshold < 1 || config_.half_open_max_calls < 1 ||
      config_.reset_timeout.count() < 0) {
    throw ExecutionError::validation(
        ErrorCode::InvalidParameter,
        "invalid circuit breaker configuration for '" + name_ + "'",
        kComponent);
  }
}

// -----------------------------------------------------------------------------
// acquire(): admission decision, including the Open → HalfOpen move
// -----------------------------------------------------------------------------
std::optional<CircuitBreaker::Permit> CircuitBreaker::acquire() {
  std::lock_guard lock(mutex_);

  if (state_ == CircuitState::Open) {
    const std::int64_t elapsed = clock_.now_ms() - last_failure_ms_;
    if (elapsed < config_.reset_timeout.count()) {
      return std::nullopt;
    }
    transitionLocked(CircuitState::HalfOpen);
  }

  if (state_ == CircuitState::HalfOpen) {
    if (half_open_in_flight_ >= config_.half_open_max_calls) {
      return std::nullopt;
    }
    ++half_open_in_flight_;
    return Permit{generation_, true};
  }

  return Permit{generation_, false};
}

// -----------------------------------------------------------------------------
// complete(): apply one outcome
// -----------------------------------------------------------------------------
void CircuitBreaker::complete(const Permit& permit, Outcome outcome) {
  std::lock_guard lock(mutex_);

  // The breaker changed state since this call was admitted. Its outcome
  // belongs to a window that no longer exists.
  if (permit.generation != generation_) {
    return;
  }

  if (permit.probe) {
    if (half_open_in_flight_ > 0) {
      --half_open_in_flight_;
    }
    switch (outcome) {
      case Outcome::Success:
        if (++half_open_successes_ >= config_.half_open_max_calls) {
          transitionLocked(CircuitState::Closed);
        }
        break;
      case Outcome::Failure:
        last_failure_ms_ = clock_.now_ms();
        transitionLocked(CircuitState::Open);
        break;
      case Outcome::Neutral:
        break;
    }
    return;
  }

  // Closed-state call. Only a manual record*() can reach here while the
  // breaker is Open; it holds no admission and must not restart the timer.
  if (state_ != CircuitState::Closed) {
    return;
  }
  switch (outcome) {
    case Outcome::Success:
      failure_count_ = 0;
      break;
    case Outcome::Failure:
      ++failure_count_;
      last_failure_ms_ = clock_.now_ms();
      if (failure_count_ >= config_.failure_threshold) {
        transitionLocked(CircuitState::Open);
      }
      break;
    case Outcome::Neutral:
      break;
  }
}

// -----------------------------------------------------------------------------
// transitionLocked(): every state change goes through here
// -----------------------------------------------------------------------------
void CircuitBreaker::transitionLocked(CircuitState next) {
  const CircuitState previous = state_;
  state_ = next;
  ++generation_;

  switch (next) {
    case CircuitState::Closed:
      failure_count_ = 0;
      half_open_successes_ = 0;
      half_open_in_flight_ = 0;
      break;
    case CircuitState::Open:
      half_open_successes_ = 0;
      half_open_in_flight_ = 0;
      break;
    case CircuitState::HalfOpen:
      half_open_successes_ = 0;
      half_open_in_flight_ = 0;
      break;
  }

  const nlohmann::json fields = {{"name", name_},
                                 {"from", toString(previous)},
                                 {"to", toString(next)},
                                 {"failures", failure_count_}};
  if (next == CircuitState::Open) {
    logger_.warn(kComponent, "circuit opened", fields);
  } else {
    logger_.info(kComponent, "circuit state changed", fields);
  }
}

// -----------------------------------------------------------------------------
// classify(): which ExecutionErrors say something about venue health
// -----------------------------------------------------------------------------
CircuitBreaker::Outcome CircuitBreaker::classify(const ExecutionError& error) {
  if (isValidationError(error) || isCancelled(error)) {
    return Outcome::Neutral;
  }
  return Outcome::Failure;
}

void CircuitBreaker::throwOpen() const {
  throw ExecutionError::system(ErrorCode::CircuitOpen,
                               "circuit breaker '" + name_ + "' is open",
                               kComponent)
      .withSeverity(ErrorSeverity::Warning)
      .withDetails({{"breaker", name_}});
}

// -----------------------------------------------------------------------------
// Manual API
// -----------------------------------------------------------------------------
bool CircuitBreaker::allowRequest() { return acquire().has_value(); }

void CircuitBreaker::recordSuccess() {
  Permit permit;
  {
    std::lock_guard lock(mutex_);
    permit = Permit{generation_, state_ == CircuitState::HalfOpen};
  }
  complete(permit, Outcome::Success);
}

void CircuitBreaker::recordFailure() {
  Permit permit;
  {
    std::lock_guard lock(mutex_);
    permit = Permit{generation_, state_ == CircuitState::HalfOpen};
  }
  complete(permit, Outcome::Failure);
}

void CircuitBreaker::reset() {
  std::lock_guard lock(mutex_);
  transitionLocked(CircuitState::Closed);
  last_failure_ms_ = 0;
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() const {
  std::lock_guard lock(mutex_);
  CircuitBreakerSnapshot s;
  s.name = name_;
  s.state = state_;
  s.failure_count = failure_count_;
  s.half_open_successes = half_open_successes_;
  s.half_open_in_flight = half_open_in_flight_;
  s.last_failure_ms = last_failure_ms_;
  s.config = config_;
  return s;
}

}  // namespace orex

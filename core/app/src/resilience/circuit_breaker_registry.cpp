#include "orex/resilience/circuit_breaker_registry.hpp"

#include <mutex>

namespace orex {

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerConfig defaults,
                                               const ITimeProvider& clock,
                                               ILogger& logger)
    : defaults_(defaults), clock_(clock), logger_(logger) {}

void CircuitBreakerRegistry::setOverride(const std::string& name,
                                         CircuitBreakerConfig config) {
  std::unique_lock lock(mutex_);
  overrides_[name] = config;
}

// -----------------------------------------------------------------------------
// get(): shared-lock hit path, unique-lock re-check on miss
// -----------------------------------------------------------------------------
std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(
    const std::string& name) {
  {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  auto it = breakers_.find(name);
  if (it != breakers_.end()) {
    return it->second;
  }

  auto ov = overrides_.find(name);
  const CircuitBreakerConfig& config =
      ov != overrides_.end() ? ov->second : defaults_;

  auto breaker =
      std::make_shared<CircuitBreaker>(name, config, clock_, logger_);
  breakers_.emplace(name, breaker);

  logger_.debug(CircuitBreaker::kComponent, "breaker created",
                {{"name", name},
                 {"failureThreshold", config.failure_threshold},
                 {"resetTimeoutMs", config.reset_timeout.count()},
                 {"halfOpenMaxCalls", config.half_open_max_calls}});
  return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(
    const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto it = breakers_.find(name);
  return it == breakers_.end() ? nullptr : it->second;
}

std::vector<CircuitBreakerSnapshot> CircuitBreakerRegistry::snapshot() const {
  std::vector<std::shared_ptr<CircuitBreaker>> copy;
  {
    std::shared_lock lock(mutex_);
    copy.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
      copy.push_back(breaker);
    }
  }

  // Each breaker takes its own lock; do not hold ours while it does.
  std::vector<CircuitBreakerSnapshot> out;
  out.reserve(copy.size());
  for (const auto& breaker : copy) {
    out.push_back(breaker->snapshot());
  }
  return out;
}

bool CircuitBreakerRegistry::reset(const std::string& name) {
  auto breaker = find(name);
  if (!breaker) {
    return false;
  }
  breaker->reset();
  return true;
}

void CircuitBreakerRegistry::resetAll() {
  std::vector<std::shared_ptr<CircuitBreaker>> copy;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [name, breaker] : breakers_) {
      copy.push_back(breaker);
    }
  }
  for (const auto& breaker : copy) {
    breaker->reset();
  }
}

}  // namespace orex

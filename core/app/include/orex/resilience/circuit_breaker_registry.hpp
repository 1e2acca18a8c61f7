#pragma once

#include "orex/resilience/circuit_breaker.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// CircuitBreakerRegistry — one breaker per destination, created on demand
// -----------------------------------------------------------------------------
//
// @brief  Maps a destination name (venue, bridge endpoint) to its
//         CircuitBreaker, constructing it on first use with the default
//         config or a per-destination override.
//
// @details
// Several broker clients that point at the same venue share one breaker,
// because the breaker protects the venue rather than the client account.
//
// Lookup uses the same read-then-write double-checked pattern as the broker
// router: a shared lock for the common hit path, a unique lock and re-check
// on miss, so concurrent first use yields one breaker.
//
// Thread model: all methods thread-safe. Returned shared_ptrs stay valid
// after the registry is destroyed.
// -----------------------------------------------------------------------------
class CircuitBreakerRegistry {
 public:
  CircuitBreakerRegistry(CircuitBreakerConfig defaults,
                         const ITimeProvider& clock, ILogger& logger);

  CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
  CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

  // Config used the first time `name` is requested. Has no effect on a
  // breaker that already exists.
  void setOverride(const std::string& name, CircuitBreakerConfig config);

  std::shared_ptr<CircuitBreaker> get(const std::string& name);

  // nullptr if no breaker has been created for `name`.
  std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

  // Snapshots ordered by name.
  std::vector<CircuitBreakerSnapshot> snapshot() const;

  // @return false if no breaker exists for `name`.
  bool reset(const std::string& name);
  void resetAll();

  const CircuitBreakerConfig& defaults() const { return defaults_; }

 private:
  const CircuitBreakerConfig defaults_;
  const ITimeProvider& clock_;
  ILogger& logger_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, CircuitBreakerConfig> overrides_;
  std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace orex

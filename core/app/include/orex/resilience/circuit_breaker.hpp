#pragma once

#include "orex/errors/execution_error.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace orex {

enum class CircuitState {
  Closed,
  Open,
  HalfOpen,
};

const char* toString(CircuitState state);

// -----------------------------------------------------------------------------
// CircuitBreakerConfig
// -----------------------------------------------------------------------------
struct CircuitBreakerConfig {
  // Consecutive failures in Closed that trip the breaker.
  int failure_threshold{5};

  // Time after the last failure before an Open breaker admits a probe.
  std::chrono::milliseconds reset_timeout{30'000};

  // Concurrent probes allowed in HalfOpen, and the number of successes
  // needed there to close.
  int half_open_max_calls{1};
};

// Point-in-time copy of a breaker's counters for reporting.
struct CircuitBreakerSnapshot {
  std::string name;
  CircuitState state{CircuitState::Closed};
  int failure_count{0};
  int half_open_successes{0};
  int half_open_in_flight{0};
  std::int64_t last_failure_ms{0};
  CircuitBreakerConfig config;
};

// -----------------------------------------------------------------------------
// CircuitBreaker — per-destination failure gate
// -----------------------------------------------------------------------------
//
// @brief  Wraps calls to one destination (a venue, a bridge endpoint) and
//         stops calling it after repeated failures.
//
// @details
// State machine:
//
//   Closed ──(failure_count reaches threshold)──> Open
//   Open ──(reset_timeout since last failure; next call)──> HalfOpen
//   HalfOpen ──(any probe failure)──> Open   (last failure time reset)
//   HalfOpen ──(half_open_max_calls successes)──> Closed  (counters zeroed)
//
// A success in Closed clears failure_count, so the threshold counts
// consecutive failures.
//
// Outcome classification inside execute():
//   returns normally                       → success
//   throws ExecutionError Validation       → neutral (the venue answered;
//                                            the request was bad)
//   throws ExecutionError Cancelled        → neutral (caller gave up)
//   throws any other ExecutionError or
//   std::exception                         → failure
//   throws anything else                   → neutral; the probe slot is
//                                            released by the permit guard
//
// While Open, execute() throws System/ERR_CIRCUIT_OPEN
// ("circuit breaker '<name>' is open") without invoking the callable.
//
// Concurrency:
//   All transitions happen under one mutex. HalfOpen admission counts
//   in-flight probes, so two threads racing to probe cannot both get in
//   when half_open_max_calls = 1. Every admission carries the breaker's
//   generation; an outcome that arrives after the breaker has already moved
//   to a new state (e.g. a slow Closed-era call finishing after the breaker
//   opened) is ignored.
//
// Ownership:
//   Usually held by CircuitBreakerRegistry via shared_ptr. Holds references
//   to the clock and logger, which must outlive it.
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  static constexpr const char* kComponent = "CircuitBreaker";

  CircuitBreaker(std::string name, CircuitBreakerConfig config,
                 const ITimeProvider& clock, ILogger& logger);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;
  CircuitBreaker(CircuitBreaker&&) = delete;
  CircuitBreaker& operator=(CircuitBreaker&&) = delete;

  // -------------------------------------------------------------------------
  // execute(fn)
  // -------------------------------------------------------------------------
  // @brief  Runs fn if the breaker admits it and records the outcome.
  //
  // @return Whatever fn returns.
  // @throws ExecutionError (ERR_CIRCUIT_OPEN) when not admitted; otherwise
  //         rethrows whatever fn threw.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto execute(Fn&& fn) -> std::invoke_result_t<Fn&>;

  // -------------------------------------------------------------------------
  // allowRequest() / recordSuccess() / recordFailure()
  // -------------------------------------------------------------------------
  // Manual form for callers that cannot hand over a callable. Each
  // allowRequest() that returns true must be followed by exactly one
  // record*() call.
  // -------------------------------------------------------------------------
  bool allowRequest();
  void recordSuccess();
  void recordFailure();

  // Forces Closed and clears every counter.
  void reset();

  CircuitState state() const;
  CircuitBreakerSnapshot snapshot() const;
  const std::string& name() const { return name_; }
  const CircuitBreakerConfig& config() const { return config_; }

 private:
  enum class Outcome { Success, Failure, Neutral };

  struct Permit {
    std::uint64_t generation{0};
    bool probe{false};
  };

  // Releases the permit as Neutral unless complete() was called.
  class PermitGuard {
   public:
    PermitGuard(CircuitBreaker& breaker, Permit permit)
        : breaker_(breaker), permit_(permit) {}
    ~PermitGuard() {
      if (!done_) {
        breaker_.complete(permit_, Outcome::Neutral);
      }
    }
    PermitGuard(const PermitGuard&) = delete;
    PermitGuard& operator=(const PermitGuard&) = delete;

    void finish(Outcome outcome) {
      done_ = true;
      breaker_.complete(permit_, outcome);
    }

   private:
    CircuitBreaker& breaker_;
    Permit permit_;
    bool done_{false};
  };

  std::optional<Permit> acquire();
  void complete(const Permit& permit, Outcome outcome);
  static Outcome classify(const ExecutionError& error);

  // Caller holds mutex_.
  void transitionLocked(CircuitState next);

  [[noreturn]] void throwOpen() const;

  const std::string name_;
  const CircuitBreakerConfig config_;
  const ITimeProvider& clock_;
  ILogger& logger_;

  mutable std::mutex mutex_;
  CircuitState state_{CircuitState::Closed};
  int failure_count_{0};
  int half_open_successes_{0};
  int half_open_in_flight_{0};
  std::int64_t last_failure_ms_{0};
  std::uint64_t generation_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: execute
// -----------------------------------------------------------------------------
template <typename Fn>
auto CircuitBreaker::execute(Fn&& fn) -> std::invoke_result_t<Fn&> {
  std::optional<Permit> permit = acquire();
  if (!permit) {
    throwOpen();
  }

  PermitGuard guard(*this, *permit);
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
      fn();
      guard.finish(Outcome::Success);
    } else {
      auto result = fn();
      guard.finish(Outcome::Success);
      return result;
    }
  } catch (const ExecutionError& e) {
    guard.finish(classify(e));
    throw;
  } catch (const std::exception&) {
    guard.finish(Outcome::Failure);
    throw;
  }
}

}  // namespace orex

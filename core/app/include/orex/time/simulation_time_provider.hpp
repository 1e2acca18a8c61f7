#pragma once

#include "orex/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace orex {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" only moves when told to.
//
// @details
// Tests construct one, hand it to a CircuitBreaker / RiskManager /
// OrderLifecycleManager, and then step time explicitly:
//
//   SimulationTimeProvider clock{1'700'000'000'000};
//   breaker.execute(failing);             // trips the breaker
//   clock.advance_by(30'000);             // reset timeout elapses
//   breaker.execute(succeeding);          // half-open probe
//
// Storage is a single std::atomic<int64_t>, so readers on worker threads
// (dependency trigger loop, maintenance thread) see the latest value
// without locking.
//
// Thread model: any thread may read; writes are expected from the test
//               thread but are atomic regardless.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // @param  start_ms  Initial epoch milliseconds.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute value. Monotonicity is not
  //         enforced; tests may rewind.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by a relative amount.
  // @return The new time.
  // -------------------------------------------------------------------------
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace orex

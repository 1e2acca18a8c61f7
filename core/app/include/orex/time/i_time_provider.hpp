#pragma once

#include <cstdint>

namespace orex {

// -----------------------------------------------------------------------------
// ITimeProvider — injectable clock for every time-dependent component
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" so that circuit breaker reset windows,
//         rate-limit windows, lifecycle timestamps and order expiry can be
//         driven deterministically in tests.
//
// @details
// Components never call std::chrono::system_clock::now() directly. They
// receive `const ITimeProvider&` at construction and call now_ms():
//
//   - LiveTimeProvider        → wall clock, used by the engine binary.
//   - SimulationTimeProvider  → manually advanced, used by tests to step
//                               past a breaker's reset timeout or a GTD
//                               order's expiry without sleeping.
//
// Time is expressed as int64_t milliseconds since the Unix epoch. That is
// the unit carried in control-plane JSON and in the bridge connector's wire
// messages, so no chrono conversion is needed at those edges.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from any thread.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in epoch milliseconds.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace orex

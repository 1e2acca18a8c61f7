#pragma once

#include "orex/errors/error_handler.hpp"
#include "orex/errors/execution_error.hpp"

#include <chrono>
#include <optional>
#include <utility>

namespace orex {

// Value type for routed operations that return nothing.
struct Ack {};

// -----------------------------------------------------------------------------
// RouteResult<T> — outcome of one routed broker call
// -----------------------------------------------------------------------------
//
// @brief  Either a value or a classified error, never both.
//
// @details
// On failure, `error` is the classifier's reported error (generalized for
// Network/System) and `should_retry` / `retry_delay` / `attempt` are copied
// from its RetryDecision. The router does not loop; whoever holds the
// result decides whether to call again.
// -----------------------------------------------------------------------------
template <typename T>
struct RouteResult {
  std::optional<T> value;
  bool should_retry{false};
  std::optional<ExecutionError> error;
  int attempt{0};
  std::chrono::milliseconds retry_delay{0};

  bool ok() const { return value.has_value(); }

  static RouteResult success(T v) {
    RouteResult r;
    r.value = std::move(v);
    return r;
  }

  static RouteResult failure(const RetryDecision& decision) {
    RouteResult r;
    r.should_retry = decision.should_retry;
    r.error = decision.reported;
    r.attempt = decision.attempt;
    r.retry_delay = decision.retry_delay;
    return r;
  }
};

}  // namespace orex

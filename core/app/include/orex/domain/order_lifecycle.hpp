#pragma once

#include "orex/domain/order.hpp"
#include "orex/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orex {
namespace domain {

// -----------------------------------------------------------------------------
// LifecycleState — engine-side order state machine
// -----------------------------------------------------------------------------
//
// @details
//   Created → Validated → Submitted → Acknowledged → PartiallyFilled → Completed
//                              │            │               │
//                              └────────────┴──> Cancelling ┘──> Cancelled
//
// Cancelled, Rejected and Failed are reachable from every non-terminal
// state. Expired is reachable from Acknowledged and PartiallyFilled.
// Terminal: Completed, Cancelled, Rejected, Expired, Failed.
//
// The full table lives in OrderLifecycleManager::isValidTransition.
// -----------------------------------------------------------------------------
enum class LifecycleState {
  Created,
  Validated,
  Submitted,
  Acknowledged,
  PartiallyFilled,
  Completed,
  Cancelling,
  Cancelled,
  Rejected,
  Expired,
  Failed,
};

// Every state, in declaration order. Used by exhaustive table tests and by
// the control plane when it lists state counts.
inline constexpr LifecycleState kAllLifecycleStates[] = {
    LifecycleState::Created,      LifecycleState::Validated,
    LifecycleState::Submitted,    LifecycleState::Acknowledged,
    LifecycleState::PartiallyFilled, LifecycleState::Completed,
    LifecycleState::Cancelling,   LifecycleState::Cancelled,
    LifecycleState::Rejected,     LifecycleState::Expired,
    LifecycleState::Failed,
};

const char* toString(LifecycleState state);
std::optional<LifecycleState> parseLifecycleState(std::string_view text);

// -----------------------------------------------------------------------------
// OrderEvent — one immutable record per successful transition
// -----------------------------------------------------------------------------
struct OrderEvent {
  std::string id;                      // "evt-<n>", unique per manager
  OrderId order_id;
  std::optional<LifecycleState> previous_state;  // empty on the creation event
  LifecycleState state{LifecycleState::Created};
  std::string event_type;              // cause tag, e.g. "VALIDATION_PASSED"
  Timestamp timestamp{};
  nlohmann::json metadata = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// OrderLifecycle — snapshot of one order's state and history
// -----------------------------------------------------------------------------
// `events` is append-only inside the manager: size() == 1 + number of
// successful transitions, and events.front().state == Created.
// -----------------------------------------------------------------------------
struct OrderLifecycle {
  Order order;
  LifecycleState current_state{LifecycleState::Created};
  std::vector<OrderEvent> events;
  Timestamp created_at{};
  Timestamp updated_at{};
};

}  // namespace domain
}  // namespace orex

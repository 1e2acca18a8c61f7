#pragma once

#include "orex/time/i_time_provider.hpp"

namespace orex {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock. Used by the engine binary.
//
// Thread model: stateless; safe from any thread.
// Ownership:    created in main() and lent to ExecutionEngine.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace orex

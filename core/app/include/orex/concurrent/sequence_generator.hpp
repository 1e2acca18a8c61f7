#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace orex {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe "<prefix>-<n>" identifier source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, monotonically increasing string identifiers for
//         lifecycle events ("evt-1"), dependencies ("dep-1") and other
//         engine-minted records.
//
// @details
// The counter starts at 1 and is advanced with fetch_add(relaxed): the only
// requirement is uniqueness, not ordering relative to other memory.
//
// Each manager owns its own generator as a value member. Two isolated
// engine instances therefore mint overlapping IDs, which is fine because
// the IDs are only meaningful inside their owning manager.
//
// Thread model: next() is safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  explicit SequenceGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next()
  // -------------------------------------------------------------------------
  // @return "<prefix>-<n>" with n unique for this generator instance.
  // -------------------------------------------------------------------------
  std::string next() {
    return prefix_ + "-" +
           std::to_string(counter_.fetch_add(1, std::memory_order_relaxed));
  }

  // Raw counter value for callers that only need a number.
  std::uint64_t next_value() {
    return counter_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> counter_{1};
};

}  // namespace orex

#pragma once

#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <atomic>
#include <mutex>
#include <ostream>

namespace orex {

// -----------------------------------------------------------------------------
// ConsoleLogger — ILogger writing to std::cout / std::cerr
// -----------------------------------------------------------------------------
//
// @brief  Emits one line per record:
//
//   2026-10-19T09:15:02.118Z [WARN][CircuitBreaker] circuit opened name=venue-a failures=5
//
// @details
// Debug and Info go to the "out" stream, Warn and above to the "err" stream,
// the same split the engine's components have always used for progress vs.
// problems. String field values are printed bare, everything else as
// compact JSON.
//
// Records below min_level are dropped before formatting. The threshold may
// be changed at runtime (control plane) and is read atomically.
//
// Thread model: a mutex serializes writes so concurrent lines never
// interleave.
// -----------------------------------------------------------------------------
class ConsoleLogger final : public ILogger {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock      Source of the line timestamp. Must outlive the logger.
  // @param  min_level  Lowest level that is written.
  // @param  out / err  Destinations; default to std::cout / std::cerr.
  //                    Tests pass string streams.
  // -------------------------------------------------------------------------
  ConsoleLogger(const ITimeProvider& clock, LogLevel min_level);
  ConsoleLogger(const ITimeProvider& clock, LogLevel min_level,
                std::ostream& out, std::ostream& err);

  ConsoleLogger(const ConsoleLogger&) = delete;
  ConsoleLogger& operator=(const ConsoleLogger&) = delete;

  void log(LogLevel level, std::string_view component,
           std::string_view message, const nlohmann::json& fields) override;

  void setMinLevel(LogLevel level) { min_level_.store(level); }
  LogLevel minLevel() const { return min_level_.load(); }

 private:
  const ITimeProvider& clock_;
  std::atomic<LogLevel> min_level_;
  std::ostream& out_;
  std::ostream& err_;
  std::mutex write_mutex_;
};

}  // namespace orex

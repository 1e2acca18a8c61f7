#include "orex/logging/console_logger.hpp"
#include "orex/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>

namespace orex {

// -----------------------------------------------------------------------------
// toString / parseLogLevel
// -----------------------------------------------------------------------------
const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "warn" || lower == "warning") return LogLevel::Warn;
  if (lower == "error") return LogLevel::Error;
  if (lower == "fatal") return LogLevel::Fatal;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
ConsoleLogger::ConsoleLogger(const ITimeProvider& clock, LogLevel min_level)
    : ConsoleLogger(clock, min_level, std::cout, std::cerr) {}

ConsoleLogger::ConsoleLogger(const ITimeProvider& clock, LogLevel min_level,
                             std::ostream& out, std::ostream& err)
    : clock_(clock), min_level_(min_level), out_(out), err_(err) {}

// -----------------------------------------------------------------------------
// log(): format outside the lock, write inside it
// -----------------------------------------------------------------------------
void ConsoleLogger::log(LogLevel level, std::string_view component,
                        std::string_view message,
                        const nlohmann::json& fields) {
  if (level < min_level_.load()) {
    return;
  }

  std::ostringstream line;
  line << format_iso8601(ms_to_timestamp(clock_.now_ms())) << " ["
       << toString(level) << "][" << component << "] " << message;

  if (fields.is_object()) {
    for (const auto& [key, value] : fields.items()) {
      line << ' ' << key << '=';
      if (value.is_string()) {
        line << value.get<std::string>();
      } else {
        line << value.dump();
      }
    }
  }
  line << '\n';

  std::ostream& sink = level >= LogLevel::Warn ? err_ : out_;

  std::lock_guard lock(write_mutex_);
  sink << line.str();
  sink.flush();
}

}  // namespace orex

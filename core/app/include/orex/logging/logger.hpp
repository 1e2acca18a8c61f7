#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace orex {

// -----------------------------------------------------------------------------
// LogLevel
// -----------------------------------------------------------------------------
// Ordered by severity so a threshold comparison (level >= min_level) decides
// whether a line is emitted.
// -----------------------------------------------------------------------------
enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
  Fatal,
};

const char* toString(LogLevel level);

// Parses "debug", "INFO", "warn", ... (case-insensitive). std::nullopt for
// anything else.
std::optional<LogLevel> parseLogLevel(std::string_view text);

// -----------------------------------------------------------------------------
// ILogger — structured logging capability consumed by every component
// -----------------------------------------------------------------------------
//
// @brief  Sink for "[LEVEL][Component] message key=value ..." records.
//
// @details
// Components receive `ILogger&` at construction and never decide where
// lines go. Structured fields are an nlohmann::json object so call sites
// read naturally:
//
//   logger_.warn("BrokerRouter", "dealer capability missing, falling back",
//                {{"clientId", client_id}, {"targetClientId", target}});
//
// fatal() records the line at the highest severity and returns; it never
// terminates the process. Shutdown decisions belong to main().
//
// Thread-safety contract: implementations MUST accept concurrent calls from
// any thread.
// -----------------------------------------------------------------------------
class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void log(LogLevel level, std::string_view component,
                   std::string_view message, const nlohmann::json& fields) = 0;

  void debug(std::string_view component, std::string_view message,
             const nlohmann::json& fields = nlohmann::json::object()) {
    log(LogLevel::Debug, component, message, fields);
  }
  void info(std::string_view component, std::string_view message,
            const nlohmann::json& fields = nlohmann::json::object()) {
    log(LogLevel::Info, component, message, fields);
  }
  void warn(std::string_view component, std::string_view message,
            const nlohmann::json& fields = nlohmann::json::object()) {
    log(LogLevel::Warn, component, message, fields);
  }
  void error(std::string_view component, std::string_view message,
             const nlohmann::json& fields = nlohmann::json::object()) {
    log(LogLevel::Error, component, message, fields);
  }
  void fatal(std::string_view component, std::string_view message,
             const nlohmann::json& fields = nlohmann::json::object()) {
    log(LogLevel::Fatal, component, message, fields);
  }
};

}  // namespace orex

#pragma once

#include "orex/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace orex {

// -----------------------------------------------------------------------------
// ErrorType — failure taxonomy that drives retry decisions
// -----------------------------------------------------------------------------
//
//   Validation  bad input or venue rejection. Never retried, message is
//               surfaced verbatim.
//   Execution   operation-specific venue failure. Retried up to the budget,
//               detail preserved for the caller.
//   Network     timeout / connectivity. Retried with the same budget;
//               detail generalized before it leaves the engine.
//   System      unexpected internal failure (including an open breaker).
//               Retried conservatively, logged at Critical.
// -----------------------------------------------------------------------------
enum class ErrorType {
  Validation,
  Execution,
  Network,
  System,
};

enum class ErrorSeverity {
  Info,
  Warning,
  Error,
  Critical,
};

// -----------------------------------------------------------------------------
// ErrorCode — stable machine-readable codes (rendered as "ERR_*")
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidOrder,
  InvalidParameter,
  OrderNotFound,
  InsufficientMargin,
  PositionLimitExceeded,
  RateLimitExceeded,
  OrderRejected,
  ConnectionFailed,
  NotConnected,
  AuthenticationFailed,
  ExecutionFailed,
  Timeout,
  Cancelled,
  CircuitOpen,
  InternalError,
  UnsupportedOperation,
};

const char* toString(ErrorType type);
const char* toString(ErrorSeverity severity);
const char* toString(ErrorCode code);

// Inverse of toString(); std::nullopt for unknown spellings. Used when an
// error crosses a process boundary as JSON.
std::optional<ErrorType> parseErrorType(std::string_view text);
std::optional<ErrorCode> parseErrorCode(std::string_view text);

// -----------------------------------------------------------------------------
// ExecutionError — the single error value used across the engine
// -----------------------------------------------------------------------------
//
// @brief  Immutable, classified failure. Thrown by managers, carried as a
//         value in router results, and consumed by the error handler.
//
// @details
// what() renders "[TYPE][SEVERITY] CODE: message", e.g.
//
//   [VALIDATION][ERROR] ERR_INVALID_ORDER: Maximum order value: order value
//   150000.00 exceeds limit of 10000.00
//
// message() returns only the human-readable part and is what callers show
// to users.
//
// Cause chain:
//   cause() is an explicit, nullable std::exception_ptr to the underlying
//   failure (a transport exception, a lower-level ExecutionError). It is
//   never walked implicitly; the free helpers at the bottom of this header
//   (rootCauseMessage, isTimeout, ...) are the only classification API.
//
// Builder-style with*() methods return modified copies, so an error can be
// enriched with order context as it moves up without mutating the
// original:
//
//   throw ExecutionError::validation(ErrorCode::InvalidOrder, msg, "RiskManager")
//       .withOrderId(order.id);
//
// Thread model: value type, safe to copy across threads.
// -----------------------------------------------------------------------------
class ExecutionError : public std::runtime_error {
 public:
  ExecutionError(ErrorType type, ErrorSeverity severity, ErrorCode code,
                 std::string message, std::string source,
                 std::exception_ptr cause = nullptr);

  // --- Factories for the common type/severity pairings ---------------------
  static ExecutionError validation(ErrorCode code, std::string message,
                                   std::string source);
  static ExecutionError execution(ErrorCode code, std::string message,
                                  std::string source,
                                  std::exception_ptr cause = nullptr);
  static ExecutionError network(ErrorCode code, std::string message,
                                std::string source,
                                std::exception_ptr cause = nullptr);
  static ExecutionError system(ErrorCode code, std::string message,
                               std::string source,
                               std::exception_ptr cause = nullptr);

  ErrorType type() const { return type_; }
  ErrorSeverity severity() const { return severity_; }
  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& source() const { return source_; }
  const std::string& orderId() const { return order_id_; }
  const nlohmann::json& details() const { return details_; }
  Timestamp timestamp() const { return timestamp_; }
  const std::exception_ptr& cause() const { return cause_; }

  ExecutionError withOrderId(std::string order_id) const;
  ExecutionError withDetails(nlohmann::json details) const;
  ExecutionError withCause(std::exception_ptr cause) const;
  ExecutionError withMessage(std::string message) const;
  ExecutionError withSeverity(ErrorSeverity severity) const;

  // JSON form used by the control plane and dead-letter snapshots.
  nlohmann::json toJson() const;

 private:
  ErrorType type_;
  ErrorSeverity severity_;
  ErrorCode code_;
  std::string message_;
  std::string source_;
  std::string order_id_;
  nlohmann::json details_ = nlohmann::json::object();
  Timestamp timestamp_;
  std::exception_ptr cause_;
};

// -----------------------------------------------------------------------------
// Classification helpers
// -----------------------------------------------------------------------------
inline bool isValidationError(const ExecutionError& e) {
  return e.type() == ErrorType::Validation;
}

// Execution, Network and System are eligible for retry; Validation never is.
inline bool isRetryableType(const ExecutionError& e) {
  return e.type() != ErrorType::Validation;
}

inline bool isCircuitOpen(const ExecutionError& e) {
  return e.code() == ErrorCode::CircuitOpen;
}

inline bool isTimeout(const ExecutionError& e) {
  return e.code() == ErrorCode::Timeout;
}

inline bool isCancelled(const ExecutionError& e) {
  return e.code() == ErrorCode::Cancelled;
}

// -------------------------------------------------------------------------
// causeAsExecutionError(e)
// -------------------------------------------------------------------------
// @return The cause as an ExecutionError if it is one, std::nullopt if the
//         cause is null or a different exception type.
// -------------------------------------------------------------------------
std::optional<ExecutionError> causeAsExecutionError(const ExecutionError& e);

// -------------------------------------------------------------------------
// rootCauseMessage(e)
// -------------------------------------------------------------------------
// @brief  Follows cause() links to the innermost failure and returns its
//         message (what() for non-ExecutionError causes). Returns
//         e.message() when there is no cause.
// -------------------------------------------------------------------------
std::string rootCauseMessage(const ExecutionError& e);

// -------------------------------------------------------------------------
// toExecutionError(ptr, source)
// -------------------------------------------------------------------------
// @brief  Normalizes any captured exception into an ExecutionError. An
//         ExecutionError is returned unchanged; a std::exception becomes
//         System/InternalError with the original kept as cause.
// -------------------------------------------------------------------------
ExecutionError toExecutionError(std::exception_ptr ptr, std::string_view source);

}  // namespace orex

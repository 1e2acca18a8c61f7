#include "orex/errors/execution_error.hpp"

#include <utility>

namespace orex {

namespace {

std::string formatWhat(ErrorType type, ErrorSeverity severity, ErrorCode code,
                       const std::string& message) {
  std::string out;
  out.reserve(message.size() + 48);
  out += '[';
  out += toString(type);
  out += "][";
  out += toString(severity);
  out += "] ";
  out += toString(code);
  out += ": ";
  out += message;
  return out;
}

}  // namespace

// -----------------------------------------------------------------------------
// Enum renderers
// -----------------------------------------------------------------------------
const char* toString(ErrorType type) {
  switch (type) {
    case ErrorType::Validation: return "VALIDATION";
    case ErrorType::Execution:  return "EXECUTION";
    case ErrorType::Network:    return "NETWORK";
    case ErrorType::System:     return "SYSTEM";
  }
  return "UNKNOWN";
}

const char* toString(ErrorSeverity severity) {
  switch (severity) {
    case ErrorSeverity::Info:     return "INFO";
    case ErrorSeverity::Warning:  return "WARNING";
    case ErrorSeverity::Error:    return "ERROR";
    case ErrorSeverity::Critical: return "CRITICAL";
  }
  return "UNKNOWN";
}

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidOrder:          return "ERR_INVALID_ORDER";
    case ErrorCode::InvalidParameter:      return "ERR_INVALID_PARAMETER";
    case ErrorCode::OrderNotFound:         return "ERR_ORDER_NOT_FOUND";
    case ErrorCode::InsufficientMargin:    return "ERR_INSUFFICIENT_MARGIN";
    case ErrorCode::PositionLimitExceeded: return "ERR_POSITION_LIMIT_EXCEEDED";
    case ErrorCode::RateLimitExceeded:     return "ERR_RATE_LIMIT_EXCEEDED";
    case ErrorCode::OrderRejected:         return "ERR_ORDER_REJECTED";
    case ErrorCode::ConnectionFailed:      return "ERR_CONNECTION_FAILED";
    case ErrorCode::NotConnected:          return "ERR_NOT_CONNECTED";
    case ErrorCode::AuthenticationFailed:  return "ERR_AUTHENTICATION_FAILED";
    case ErrorCode::ExecutionFailed:       return "ERR_EXECUTION_FAILED";
    case ErrorCode::Timeout:               return "ERR_TIMEOUT";
    case ErrorCode::Cancelled:             return "ERR_CANCELLED";
    case ErrorCode::CircuitOpen:           return "ERR_CIRCUIT_OPEN";
    case ErrorCode::InternalError:         return "ERR_INTERNAL_ERROR";
    case ErrorCode::UnsupportedOperation:  return "ERR_UNSUPPORTED_OPERATION";
  }
  return "ERR_UNKNOWN";
}

std::optional<ErrorType> parseErrorType(std::string_view text) {
  for (ErrorType t : {ErrorType::Validation, ErrorType::Execution,
                      ErrorType::Network, ErrorType::System}) {
    if (text == toString(t)) {
      return t;
    }
  }
  return std::nullopt;
}

std::optional<ErrorCode> parseErrorCode(std::string_view text) {
  const int last = static_cast<int>(ErrorCode::UnsupportedOperation);
  for (int i = 0; i <= last; ++i) {
    const auto code = static_cast<ErrorCode>(i);
    if (text == toString(code)) {
      return code;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionError::ExecutionError(ErrorType type, ErrorSeverity severity,
                               ErrorCode code, std::string message,
                               std::string source, std::exception_ptr cause)
    : std::runtime_error(formatWhat(type, severity, code, message)),
      type_(type),
      severity_(severity),
      code_(code),
      message_(std::move(message)),
      source_(std::move(source)),
      timestamp_(std::chrono::system_clock::now()),
      cause_(std::move(cause)) {}

// -----------------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------------
ExecutionError ExecutionError::validation(ErrorCode code, std::string message,
                                          std::string source) {
  return ExecutionError(ErrorType::Validation, ErrorSeverity::Error, code,
                        std::move(message), std::move(source));
}

ExecutionError ExecutionError::execution(ErrorCode code, std::string message,
                                         std::string source,
                                         std::exception_ptr cause) {
  return ExecutionError(ErrorType::Execution, ErrorSeverity::Error, code,
                        std::move(message), std::move(source),
                        std::move(cause));
}

ExecutionError ExecutionError::network(ErrorCode code, std::string message,
                                       std::string source,
                                       std::exception_ptr cause) {
  return ExecutionError(ErrorType::Network, ErrorSeverity::Error, code,
                        std::move(message), std::move(source),
                        std::move(cause));
}

ExecutionError ExecutionError::system(ErrorCode code, std::string message,
                                      std::string source,
                                      std::exception_ptr cause) {
  return ExecutionError(ErrorType::System, ErrorSeverity::Critical, code,
                        std::move(message), std::move(source),
                        std::move(cause));
}

// -----------------------------------------------------------------------------
// with*(): copy-and-modify. The message-changing variants rebuild the
// runtime_error base so what() stays consistent.
// -----------------------------------------------------------------------------
ExecutionError ExecutionError::withOrderId(std::string order_id) const {
  ExecutionError copy(*this);
  copy.order_id_ = std::move(order_id);
  return copy;
}

ExecutionError ExecutionError::withDetails(nlohmann::json details) const {
  ExecutionError copy(*this);
  copy.details_ = std::move(details);
  return copy;
}

ExecutionError ExecutionError::withCause(std::exception_ptr cause) const {
  ExecutionError copy(*this);
  copy.cause_ = std::move(cause);
  return copy;
}

ExecutionError ExecutionError::withMessage(std::string message) const {
  ExecutionError copy(type_, severity_, code_, std::move(message), source_,
                      cause_);
  copy.order_id_ = order_id_;
  copy.details_ = details_;
  copy.timestamp_ = timestamp_;
  return copy;
}

ExecutionError ExecutionError::withSeverity(ErrorSeverity severity) const {
  ExecutionError copy(type_, severity, code_, message_, source_, cause_);
  copy.order_id_ = order_id_;
  copy.details_ = details_;
  copy.timestamp_ = timestamp_;
  return copy;
}

// -----------------------------------------------------------------------------
// toJson()
// -----------------------------------------------------------------------------
nlohmann::json ExecutionError::toJson() const {
  nlohmann::json j;
  j["type"] = toString(type_);
  j["severity"] = toString(severity_);
  j["code"] = toString(code_);
  j["message"] = message_;
  j["source"] = source_;
  j["timestamp"] = format_iso8601(timestamp_);
  if (!order_id_.empty()) {
    j["orderId"] = order_id_;
  }
  if (!details_.empty()) {
    j["details"] = details_;
  }
  if (cause_) {
    j["cause"] = rootCauseMessage(*this);
  }
  return j;
}

// -----------------------------------------------------------------------------
// causeAsExecutionError()
// -----------------------------------------------------------------------------
std::optional<ExecutionError> causeAsExecutionError(const ExecutionError& e) {
  if (!e.cause()) {
    return std::nullopt;
  }
  try {
    std::rethrow_exception(e.cause());
  } catch (const ExecutionError& inner) {
    return inner;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// rootCauseMessage()
// -----------------------------------------------------------------------------
std::string rootCauseMessage(const ExecutionError& e) {
  const ExecutionError* current = &e;
  std::optional<ExecutionError> holder;

  while (current->cause()) {
    try {
      std::rethrow_exception(current->cause());
    } catch (const ExecutionError& inner) {
      holder.emplace(inner);
      current = &*holder;
      continue;
    } catch (const std::exception& other) {
      return other.what();
    }
  }
  return current->message();
}

// -----------------------------------------------------------------------------
// toExecutionError()
// -----------------------------------------------------------------------------
// Only ExecutionError and std::exception are translated. Anything else is
// not something this engine throws, so it propagates untouched.
// -----------------------------------------------------------------------------
ExecutionError toExecutionError(std::exception_ptr ptr,
                                std::string_view source) {
  try {
    std::rethrow_exception(ptr);
  } catch (const ExecutionError& e) {
    return e;
  } catch (const std::exception& e) {
    return ExecutionError::system(ErrorCode::InternalError, e.what(),
                                  std::string(source), ptr);
  }
}

}  // namespace orex

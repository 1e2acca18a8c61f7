#pragma once

#include "orex/broker/broker_router.hpp"
#include "orex/domain/broker_types.hpp"
#include "orex/domain/risk_limits.hpp"
#include "orex/domain/risk_profile.hpp"
#include "orex/errors/error_handler.hpp"
#include "orex/logging/logger.hpp"
#include "orex/monitoring/order_monitor.hpp"
#include "orex/resilience/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace orex {

struct LoggingConfig {
  LogLevel level{LogLevel::Info};
};

struct BreakerSettings {
  CircuitBreakerConfig defaults;
  std::map<std::string, CircuitBreakerConfig> overrides;
};

struct RiskSettings {
  domain::RiskLimits limits;
  std::vector<domain::RiskProfile> profiles;
};

struct EngineTuning {
  std::chrono::milliseconds call_timeout{5000};
  std::chrono::milliseconds expiry_check_interval{1000};
  std::size_t dead_letter_capacity{1000};
};

// Empty endpoints disable the control server.
struct ControlConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig — everything orex_engine reads at startup
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (every section optional):
//
//   {
//     "logging":         {"level": "info"},
//     "error_handling":  {"max_retries": 3, "base_retry_delay_ms": 100,
//                         "max_retry_delay_ms": 30000, "jitter": 0.2},
//     "circuit_breaker": {"failure_threshold": 5, "reset_timeout_ms": 30000,
//                         "half_open_max_calls": 1,
//                         "overrides": {"venue-a": {"failure_threshold": 2}}},
//     "risk":            {"limits": {...}, "profiles": [...]},
//     "brokers":         {"C1": {"type": "simulated", "destination": "sim",
//                                "params": {...}}},
//     "sessions":        {"C1": {"user_id": "trader-1", "password": "..."}},
//     "dealer_fallback": "account",
//     "engine":          {"call_timeout_ms": 5000,
//                         "expiry_check_interval_ms": 1000,
//                         "dead_letter_capacity": 1000},
//     "monitoring":      {"enabled": true, "delay_threshold_ms": 30000,
//                         "partial_fill_threshold_ms": 60000,
//                         "price_deviation_pct": 5.0},
//     "control":         {"command_endpoint": "tcp://127.0.0.1:5556",
//                         "telemetry_endpoint": "tcp://127.0.0.1:5557"}
//   }
//
// "sessions" lists clients the engine logs in at start().
//
// Environment overrides (applied by applyEnvironment()):
//   OREX_LOG_LEVEL               logging.level
//   OREX_CONTROL_CMD_ENDPOINT    control.command_endpoint
//   OREX_CONTROL_PUB_ENDPOINT    control.telemetry_endpoint
//
// Errors: every problem (unreadable file, malformed JSON, wrong field type,
// unknown enum spelling) is thrown as ExecutionError
// Validation/InvalidParameter with source "EngineConfig".
// -----------------------------------------------------------------------------
struct EngineConfig {
  static constexpr const char* kComponent = "EngineConfig";

  LoggingConfig logging;
  RetryPolicy error_handling;
  BreakerSettings circuit_breaker;
  RiskSettings risk;
  std::map<std::string, domain::BrokerConfig> brokers;
  std::map<std::string, domain::Credentials> sessions;
  DealerFallback dealer_fallback{DealerFallback::Account};
  EngineTuning engine;
  MonitoringConfig monitoring;
  ControlConfig control;

  static EngineConfig fromJson(const nlohmann::json& j);
  static EngineConfig fromFile(const std::string& path);

  void applyEnvironment();
};

}  // namespace orex

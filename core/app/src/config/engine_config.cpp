#include "orex/config/engine_config.hpp"

#include "orex/domain/json_codec.hpp"
#include "orex/errors/execution_error.hpp"

#include <cstdlib>
#include <fstream>

namespace orex {

namespace {

using nlohmann::json;

[[noreturn]] void fail(const std::string& message) {
  throw ExecutionError::validation(ErrorCode::InvalidParameter, message,
                                   EngineConfig::kComponent);
}

std::chrono::milliseconds msField(const json& j, const char* key,
                                  std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(
      j.value(key, static_cast<std::int64_t>(fallback.count())));
}

LogLevel parseLevel(const std::string& text) {
  auto level = parseLogLevel(text);
  if (!level) {
    fail("unknown log level: " + text);
  }
  return *level;
}

CircuitBreakerConfig parseBreaker(const json& j,
                                  const CircuitBreakerConfig& base) {
  CircuitBreakerConfig config = base;
  config.failure_threshold = j.value("failure_threshold", base.failure_threshold);
  config.reset_timeout = msField(j, "reset_timeout_ms", base.reset_timeout);
  config.half_open_max_calls =
      j.value("half_open_max_calls", base.half_open_max_calls);
  if (config.failure_threshold < 1 || config.half_open_max_calls < 1) {
    fail("circuit_breaker thresholds must be at least 1");
  }
  return config;
}

void parseSections(const json& j, EngineConfig& config) {
  if (!j.is_object()) {
    fail("configuration root must be a JSON object");
  }

  if (j.contains("logging")) {
    const json& section = j.at("logging");
    if (section.contains("level")) {
      config.logging.level = parseLevel(section.at("level").get<std::string>());
    }
  }

  if (j.contains("error_handling")) {
    const json& section = j.at("error_handling");
    RetryPolicy& policy = config.error_handling;
    policy.max_retries = section.value("max_retries", policy.max_retries);
    policy.base_retry_delay =
        msField(section, "base_retry_delay_ms", policy.base_retry_delay);
    policy.max_retry_delay =
        msField(section, "max_retry_delay_ms", policy.max_retry_delay);
    policy.jitter = section.value("jitter", policy.jitter);
    if (policy.max_retries < 1) {
      fail("error_handling.max_retries must be at least 1");
    }
  }

  if (j.contains("circuit_breaker")) {
    const json& section = j.at("circuit_breaker");
    config.circuit_breaker.defaults =
        parseBreaker(section, config.circuit_breaker.defaults);
    if (section.contains("overrides")) {
      for (const auto& [name, override_json] :
           section.at("overrides").items()) {
        config.circuit_breaker.overrides[name] =
            parseBreaker(override_json, config.circuit_breaker.defaults);
      }
    }
  }

  if (j.contains("risk")) {
    const json& section = j.at("risk");
    if (section.contains("limits")) {
      config.risk.limits = section.at("limits").get<domain::RiskLimits>();
    }
    if (section.contains("profiles")) {
      config.risk.profiles =
          section.at("profiles").get<std::vector<domain::RiskProfile>>();
    }
  }

  if (j.contains("brokers")) {
    for (const auto& [client_id, broker] : j.at("brokers").items()) {
      config.brokers[client_id] = broker.get<domain::BrokerConfig>();
    }
  }

  if (j.contains("sessions")) {
    for (const auto& [client_id, creds] : j.at("sessions").items()) {
      if (config.brokers.count(client_id) == 0) {
        fail("session configured for unknown broker client: " + client_id);
      }
      config.sessions[client_id] = creds.get<domain::Credentials>();
    }
  }

  if (j.contains("dealer_fallback")) {
    const std::string text = j.at("dealer_fallback").get<std::string>();
    auto policy = parseDealerFallback(text);
    if (!policy) {
      fail("unknown dealer_fallback: " + text);
    }
    config.dealer_fallback = *policy;
  }

  if (j.contains("engine")) {
    const json& section = j.at("engine");
    EngineTuning& tuning = config.engine;
    tuning.call_timeout = msField(section, "call_timeout_ms", tuning.call_timeout);
    tuning.expiry_check_interval = msField(section, "expiry_check_interval_ms",
                                           tuning.expiry_check_interval);
    tuning.dead_letter_capacity =
        section.value("dead_letter_capacity", tuning.dead_letter_capacity);
  }

  if (j.contains("monitoring")) {
    const json& section = j.at("monitoring");
    MonitoringConfig& monitoring = config.monitoring;
    monitoring.enabled = section.value("enabled", monitoring.enabled);
    monitoring.delay_threshold =
        msField(section, "delay_threshold_ms", monitoring.delay_threshold);
    monitoring.partial_fill_threshold = msField(
        section, "partial_fill_threshold_ms", monitoring.partial_fill_threshold);
    monitoring.price_deviation_pct =
        section.value("price_deviation_pct", monitoring.price_deviation_pct);
    if (monitoring.delay_threshold.count() < 0 ||
        monitoring.partial_fill_threshold.count() < 0 ||
        monitoring.price_deviation_pct < 0.0) {
      fail("monitoring thresholds must not be negative");
    }
  }

  if (j.contains("control")) {
    const json& section = j.at("control");
    config.control.command_endpoint =
        section.value("command_endpoint", config.control.command_endpoint);
    config.control.telemetry_endpoint =
        section.value("telemetry_endpoint", config.control.telemetry_endpoint);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// fromJson()
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
  EngineConfig config;
  try {
    parseSections(j, config);
  } catch (const nlohmann::json::exception& e) {
    fail(std::string("invalid configuration: ") + e.what());
  }
  return config;
}

// -----------------------------------------------------------------------------
// fromFile()
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    fail("cannot open configuration file: " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error& e) {
    fail("cannot parse " + path + ": " + e.what());
  }
  return fromJson(j);
}

// -----------------------------------------------------------------------------
// applyEnvironment()
// -----------------------------------------------------------------------------
void EngineConfig::applyEnvironment() {
  if (const char* level = std::getenv("OREX_LOG_LEVEL")) {
    logging.level = parseLevel(level);
  }
  if (const char* endpoint = std::getenv("OREX_CONTROL_CMD_ENDPOINT")) {
    control.command_endpoint = endpoint;
  }
  if (const char* endpoint = std::getenv("OREX_CONTROL_PUB_ENDPOINT")) {
    control.telemetry_endpoint = endpoint;
  }
}

}  // namespace orex

// -----------------------------------------------------------------------------
// orex_engine — single executable entry point.
//
//   1) Load the engine configuration (argv[1], or config/orex.json) and
//      apply OREX_* environment overrides.
//   2) Create the wall clock, the console logger and the connector factory
//      with the simulated and ZeroMQ-bridge connectors registered.
//   3) Construct and start the ExecutionEngine. start() logs in the
//      configured sessions and opens the control plane (REP commands, PUB
//      lifecycle telemetry).
//   4) Idle on the main thread until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread         → waits for a shutdown signal
//   engine_worker       → child placement, one-cancels-other venue cancels
//   maintenance thread  → expiry sweep
//   dependency_loop     → parent completion / termination handling
//   control server      → command REP + telemetry PUB
// -----------------------------------------------------------------------------

#include "orex/broker/broker_connector_factory.hpp"
#include "orex/config/engine_config.hpp"
#include "orex/engine/execution_engine.hpp"
#include "orex/errors/execution_error.hpp"
#include "orex/logging/console_logger.hpp"
#include "orex/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr const char* kDefaultConfigPath = "config/orex.json";

// Written by the signal handler, polled by main().
volatile std::sig_atomic_t g_shutdown_requested = 0;

void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

}  // namespace

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : kDefaultConfigPath;

  orex::LiveTimeProvider clock;

  // -------------------------------------------------------------------------
  // 1) Configuration. A broken file is fatal before anything starts.
  // -------------------------------------------------------------------------
  orex::EngineConfig config;
  try {
    config = orex::EngineConfig::fromFile(config_path);
    config.applyEnvironment();
  } catch (const orex::ExecutionError& e) {
    std::cerr << "[main] invalid configuration " << config_path << ": "
              << e.message() << "\n";
    return 2;
  }

  orex::ConsoleLogger logger(clock, config.logging.level);

  auto factory = std::make_shared<orex::BrokerConnectorFactory>();
  orex::registerDefaultConnectors(*factory, clock, logger);

  // -------------------------------------------------------------------------
  // 2) Engine.
  // -------------------------------------------------------------------------
  try {
    orex::ExecutionEngine engine(config, clock, logger, factory);
    engine.start();

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    logger.info("main", "engine running",
                {{"config", config_path},
                 {"command", config.control.command_endpoint},
                 {"telemetry", config.control.telemetry_endpoint}});

    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger.info("main", "shutdown requested");
    engine.stop();
  } catch (const orex::ExecutionError& e) {
    logger.fatal("main", "engine failed", e.toJson());
    return 1;
  }

  return 0;
}

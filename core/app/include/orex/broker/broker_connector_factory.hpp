#pragma once

#include "orex/broker/i_broker_connector.hpp"
#include "orex/domain/broker_types.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// BrokerConnectorFactory — builds connectors from BrokerConfig::type
// -----------------------------------------------------------------------------
//
// @details
// Creators are keyed by type string. create() throws
// Validation/InvalidParameter "unsupported broker type: <type>" for an
// unknown type; anything a creator throws propagates unchanged.
//
// registerDefaultConnectors() installs the two shipped kinds:
//   "simulated"   SimulatedBrokerConnector (in-process venue)
//   "zmq_bridge"  ZmqBridgeConnector (JSON over ZeroMQ REQ/REP)
//
// Thread-safety: registerCreator() and create() may race safely.
// -----------------------------------------------------------------------------
class BrokerConnectorFactory {
 public:
  static constexpr const char* kComponent = "BrokerConnectorFactory";

  using Creator = std::function<std::shared_ptr<IBrokerConnector>(
      const std::string& client_id, const domain::BrokerConfig& config)>;

  BrokerConnectorFactory() = default;
  BrokerConnectorFactory(const BrokerConnectorFactory&) = delete;
  BrokerConnectorFactory& operator=(const BrokerConnectorFactory&) = delete;

  // Replaces any creator already registered for `type`.
  void registerCreator(const std::string& type, Creator creator);

  std::shared_ptr<IBrokerConnector> create(
      const std::string& client_id, const domain::BrokerConfig& config) const;

  bool supports(const std::string& type) const;
  std::vector<std::string> types() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Creator> creators_;
};

void registerDefaultConnectors(BrokerConnectorFactory& factory,
                               const ITimeProvider& clock, ILogger& logger);

}  // namespace orex

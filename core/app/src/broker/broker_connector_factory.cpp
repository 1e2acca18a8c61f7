#include "orex/broker/broker_connector_factory.hpp"

#include "orex/broker/simulated_broker_connector.hpp"
#include "orex/broker/zmq_bridge_connector.hpp"
#include "orex/errors/execution_error.hpp"

#include <utility>

namespace orex {

void BrokerConnectorFactory::registerCreator(const std::string& type,
                                             Creator creator) {
  std::lock_guard lock(mutex_);
  creators_[type] = std::move(creator);
}

std::shared_ptr<IBrokerConnector> BrokerConnectorFactory::create(
    const std::string& client_id, const domain::BrokerConfig& config) const {
  Creator creator;
  {
    std::lock_guard lock(mutex_);
    auto it = creators_.find(config.type);
    if (it == creators_.end()) {
      throw ExecutionError::validation(ErrorCode::InvalidParameter,
                                       "unsupported broker type: " +
                                           config.type,
                                       kComponent);
    }
    creator = it->second;
  }
  // Creators may block (socket setup); run them unlocked.
  return creator(client_id, config);
}

bool BrokerConnectorFactory::supports(const std::string& type) const {
  std::lock_guard lock(mutex_);
  return creators_.count(type) != 0;
}

std::vector<std::string> BrokerConnectorFactory::types() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [type, creator] : creators_) {
    out.push_back(type);
  }
  return out;
}

// -----------------------------------------------------------------------------
// registerDefaultConnectors()
// -----------------------------------------------------------------------------
void registerDefaultConnectors(BrokerConnectorFactory& factory,
                               const ITimeProvider& clock, ILogger& logger) {
  factory.registerCreator(
      SimulatedBrokerConnector::kType,
      [&clock, &logger](const std::string& client_id,
                        const domain::BrokerConfig& config)
          -> std::shared_ptr<IBrokerConnector> {
        return std::make_shared<SimulatedBrokerConnector>(
            client_id, SimulatedBrokerConnector::optionsFromJson(config.params),
            clock, logger);
      });

  factory.registerCreator(
      ZmqBridgeConnector::kType,
      [&logger](const std::string& client_id,
                const domain::BrokerConfig& config)
          -> std::shared_ptr<IBrokerConnector> {
        return std::make_shared<ZmqBridgeConnector>(
            client_id, ZmqBridgeConnector::optionsFromJson(config.params),
            logger);
      });
}

}  // namespace orex

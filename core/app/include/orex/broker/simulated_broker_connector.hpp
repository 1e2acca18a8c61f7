#pragma once

#include "orex/broker/i_broker_connector.hpp"
#include "orex/concurrent/sequence_generator.hpp"
#include "orex/concurrent/task_loop_thread.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// SimulatedBrokerConnector — in-process venue (type "simulated")
// -----------------------------------------------------------------------------
//
// @brief  Accepts orders, keeps an order book and positions, and emits
//         execution reports from its own thread after a configurable
//         latency.
//
// @details
// Fill modes (params "fill_mode"):
//   "auto"  OPEN then FILLED for the full quantity (limit price, or the
//           configured quote price for market orders)
//   "ack"   OPEN only; fills are driven with fill()
//   "none"  no reports at all; fills are driven with fill()
//
// Other params:
//   latency_ms       delay before each report is delivered (default 10)
//   reject_symbols   array of symbols the venue refuses (Validation/
//                    OrderRejected)
//   dealer           true to expose IDealerOperations
//   quote_price      last price reported by getQuote (default 100)
//   require_login    false to accept orders without login()
//
// Thread model:
//   All public methods lock one mutex. Reports are delivered on the
//   "sim_reports" worker thread with no lock held.
//
// Ownership:
//   Created by BrokerConnectorFactory, owned by BrokerRouter.
// -----------------------------------------------------------------------------
class SimulatedBrokerConnector final : public IBrokerConnector,
                                       public IDealerOperations {
 public:
  static constexpr const char* kComponent = "SimulatedBroker";
  static constexpr const char* kType = "simulated";

  enum class FillMode { Auto, AckOnly, None };

  struct Options {
    FillMode fill_mode{FillMode::Auto};
    std::chrono::milliseconds latency{10};
    std::vector<std::string> reject_symbols;
    bool dealer{false};
    double quote_price{100.0};
    bool require_login{true};
  };

  // @throws ExecutionError Validation/InvalidParameter on a bad fill_mode.
  static Options optionsFromJson(const nlohmann::json& params);

  SimulatedBrokerConnector(std::string client_id, Options options,
                           const ITimeProvider& clock, ILogger& logger);
  ~SimulatedBrokerConnector() override;

  SimulatedBrokerConnector(const SimulatedBrokerConnector&) = delete;
  SimulatedBrokerConnector& operator=(const SimulatedBrokerConnector&) = delete;

  void connect(const CallContext& ctx) override;
  void disconnect() override;
  bool isConnected() const override;

  domain::Session login(const domain::Credentials& credentials,
                        const CallContext& ctx) override;
  void logout(const CallContext& ctx) override;

  domain::BrokerOrderResponse placeOrder(const domain::Order& order,
                                         const CallContext& ctx) override;
  domain::BrokerOrderResponse cancelOrder(const std::string& broker_order_id,
                                          const CallContext& ctx) override;
  domain::BrokerOrderResponse modifyOrder(
      const std::string& broker_order_id,
      const domain::OrderModification& modification,
      const CallContext& ctx) override;
  domain::BrokerOrderDetails getOrderStatus(const std::string& broker_order_id,
                                            const CallContext& ctx) override;

  domain::OrderBook getOrderBook(const CallContext& ctx) override;
  std::vector<domain::BrokerPosition> getPositions(
      const CallContext& ctx) override;
  std::vector<domain::Holding> getHoldings(const CallContext& ctx) override;

  domain::Quote getQuote(const std::string& symbol,
                         const CallContext& ctx) override;
  void subscribeQuotes(const std::vector<std::string>& symbols,
                       const CallContext& ctx) override;
  void unsubscribeQuotes(const std::vector<std::string>& symbols,
                         const CallContext& ctx) override;

  void setExecutionReportHandler(ExecutionReportHandler handler) override;

  IDealerOperations* dealerOperations() override {
    return options_.dealer ? this : nullptr;
  }

  domain::BrokerOrderResponse placeDealerOrder(
      const std::string& target_client_id, const domain::Order& order,
      const CallContext& ctx) override;
  domain::OrderBook getDealerOrderBook(const std::string& target_client_id,
                                       const CallContext& ctx) override;
  std::vector<domain::BrokerPosition> getDealerPositions(
      const std::string& target_client_id, const CallContext& ctx) override;

  // -------------------------------------------------------------------------
  // fill(broker_order_id, quantity, price)
  // -------------------------------------------------------------------------
  // @brief  Executes `quantity` more units at `price` and reports the new
  //         cumulative fill (PARTIALLY_FILLED or FILLED).
  //
  // @throws ExecutionError Validation/OrderNotFound for an unknown ID,
  //         Validation/OrderRejected if the order is no longer open.
  // -------------------------------------------------------------------------
  void fill(const std::string& broker_order_id, std::int64_t quantity,
            double price);

  const std::string& clientId() const { return client_id_; }
  std::size_t orderCount() const;
  std::set<std::string> subscriptions() const;

  // Blocks until queued reports have been delivered.
  bool waitForReports(std::chrono::milliseconds timeout);

 private:
  // Caller holds mutex_.
  void requireSessionLocked(const CallContext& ctx,
                            const std::string& operation) const;
  domain::BrokerOrderResponse placeLocked(const domain::Order& order,
                                          const std::string& client_id);
  domain::BrokerOrderDetails& findLocked(const std::string& broker_order_id);
  void applyFillLocked(domain::BrokerOrderDetails& details,
                       std::int64_t quantity, double price);

  void emit(domain::ExecutionReport report);

  const std::string client_id_;
  const Options options_;
  const ITimeProvider& clock_;
  ILogger& logger_;

  mutable std::mutex mutex_;
  bool connected_{false};
  std::optional<domain::Session> session_;
  std::unordered_map<std::string, domain::BrokerOrderDetails> orders_;
  std::vector<std::string> order_sequence_;
  std::unordered_map<std::string, domain::OrderId> engine_ids_;
  std::map<std::string, domain::BrokerPosition> positions_;
  std::set<std::string> subscriptions_;
  ExecutionReportHandler handler_;

  SequenceGenerator order_ids_{"SIM"};
  SequenceGenerator session_ids_{"sim-session"};
  TaskLoopThread reports_{"sim_reports"};
};

}  // namespace orex

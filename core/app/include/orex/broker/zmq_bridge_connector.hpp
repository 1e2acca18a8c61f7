#pragma once

#include "orex/broker/i_broker_connector.hpp"
#include "orex/concurrent/sequence_generator.hpp"
#include "orex/logging/logger.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// ZmqBridgeConnector — JSON request/reply client of a venue gateway
// -----------------------------------------------------------------------------
//
// @brief  Forwards every connector call to an out-of-process gateway over a
//         ZeroMQ REQ socket and, optionally, receives execution reports on
//         a SUB socket.
//
// @details
// Request frame (one message, JSON):
//   {"op": "place_order", "client_id": "C1", "request_id": "req-7",
//    "args": {...}}
//
// Reply frame:
//   {"ok": true,  "result": ...}
//   {"ok": false, "error": {"type": "VALIDATION", "code": "ERR_ORDER_REJECTED",
//                           "message": "..."}}
//
// A gateway error is rethrown as an ExecutionError with the decoded type
// and code (unknown spellings map to Execution/ExecutionFailed). A reply
// that is not valid JSON, or lacks "ok", is System/InternalError.
//
// Timeouts follow the lazy-pirate pattern: the reply is polled in short
// slices bounded by min(request_timeout, ctx.remaining()). If nothing
// arrives, the REQ socket is discarded (it is stuck in the send state) and
// recreated on the next call; the call fails with Network/Timeout. A
// cancelled context fails with Execution/Cancelled the same way.
//
// Report stream (params "report_endpoint"): each message is one
// ExecutionReport JSON object. Malformed messages are logged and dropped.
//
// Params:
//   endpoint            REQ endpoint of the gateway (required)
//   report_endpoint     SUB endpoint for reports (optional)
//   request_timeout_ms  per-request cap (default 2000)
//   dealer              true when the gateway accepts dealer ops
//
// Thread model:
//   One mutex serializes requests on the REQ socket. The SUB socket lives
//   on its own thread, started by connect() and joined by disconnect().
// -----------------------------------------------------------------------------
class ZmqBridgeConnector final : public IBrokerConnector,
                                 public IDealerOperations {
 public:
  static constexpr const char* kComponent = "ZmqBridge";
  static constexpr const char* kType = "zmq_bridge";

  struct Options {
    std::string endpoint;
    std::string report_endpoint;
    std::chrono::milliseconds request_timeout{2000};
    bool dealer{false};
  };

  // @throws ExecutionError Validation/InvalidParameter without "endpoint".
  static Options optionsFromJson(const nlohmann::json& params);

  ZmqBridgeConnector(std::string client_id, Options options, ILogger& logger);
  ~ZmqBridgeConnector() override;

  ZmqBridgeConnector(const ZmqBridgeConnector&) = delete;
  ZmqBridgeConnector& operator=(const ZmqBridgeConnector&) = delete;

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

  const Options& options() const { return options_; }

 private:
  static constexpr std::chrono::milliseconds kPollSlice{50};
  static constexpr int kReportPollTimeoutMs = 100;

  // -------------------------------------------------------------------------
  // request(op, args, ctx)
  // -------------------------------------------------------------------------
  // @return The "result" member of a successful reply (null if absent).
  // @throws ExecutionError as described in the class comment.
  // -------------------------------------------------------------------------
  nlohmann::json request(const std::string& op, nlohmann::json args,
                         const CallContext& ctx);

  // Caller holds request_mutex_.
  void ensureSocketLocked();
  void resetSocketLocked();

  [[noreturn]] void throwRemoteError(const nlohmann::json& error,
                                     const std::string& op) const;

  void runReports();
  void deliver(const std::string& payload);

  const std::string client_id_;
  const Options options_;
  ILogger& logger_;

  zmq::context_t context_{1};

  std::mutex request_mutex_;
  std::unique_ptr<zmq::socket_t> socket_;
  SequenceGenerator request_ids_{"req"};

  std::atomic<bool> connected_{false};

  std::mutex handler_mutex_;
  ExecutionReportHandler handler_;

  std::atomic<bool> reports_running_{false};
  std::thread report_thread_;
};

}  // namespace orex

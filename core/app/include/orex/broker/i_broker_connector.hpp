#pragma once

#include "orex/domain/broker_types.hpp"
#include "orex/domain/order.hpp"
#include "orex/resilience/call_context.hpp"

#include <functional>
#include <string>
#include <vector>

namespace orex {

// -----------------------------------------------------------------------------
// IDealerOperations — multi-account capability of some venues
// -----------------------------------------------------------------------------
//
// @brief  Operations a dealer login performs on behalf of another client
//         account.
//
// @details
// Optional. A connector exposes it through
// IBrokerConnector::dealerOperations(); a nullptr there means the venue
// has no dealer concept and BrokerRouter applies its DealerFallback
// policy.
// -----------------------------------------------------------------------------
class IDealerOperations {
 public:
  virtual ~IDealerOperations() = default;

  virtual domain::BrokerOrderResponse placeDealerOrder(
      const std::string& target_client_id, const domain::Order& order,
      const CallContext& ctx) = 0;

  virtual domain::OrderBook getDealerOrderBook(
      const std::string& target_client_id, const CallContext& ctx) = 0;

  virtual std::vector<domain::BrokerPosition> getDealerPositions(
      const std::string& target_client_id, const CallContext& ctx) = 0;
};

// -----------------------------------------------------------------------------
// IBrokerConnector — one authenticated client of one venue
// -----------------------------------------------------------------------------
//
// @brief  Uniform capability set over concrete venue clients.
//
// @details
// Error contract (every method):
//   - throws ExecutionError; never returns an "error" value
//   - venue rejections (bad symbol, insufficient funds at the venue) are
//     Validation errors, so they neither trip the circuit breaker nor get
//     retried
//   - transport failures are Network errors (Timeout, ConnectionFailed,
//     NotConnected)
//   - ctx is honored: a passed deadline surfaces as Network/Timeout and a
//     cancelled token as Execution/Cancelled
//
// Execution reports:
//   Asynchronous status updates (acks, fills, venue cancels) are delivered
//   through the handler set with setExecutionReportHandler(). The handler
//   may be called from a connector-owned thread and must not assume it
//   runs on the caller of placeOrder(). A report may arrive before
//   placeOrder() has returned.
//
// Thread-safety contract: implementations MUST accept concurrent calls.
// -----------------------------------------------------------------------------
class IBrokerConnector {
 public:
  using ExecutionReportHandler =
      std::function<void(const domain::ExecutionReport&)>;

  virtual ~IBrokerConnector() = default;

  virtual void connect(const CallContext& ctx) = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual domain::Session login(const domain::Credentials& credentials,
                                const CallContext& ctx) = 0;
  virtual void logout(const CallContext& ctx) = 0;

  virtual domain::BrokerOrderResponse placeOrder(const domain::Order& order,
                                                 const CallContext& ctx) = 0;
  virtual domain::BrokerOrderResponse cancelOrder(
      const std::string& broker_order_id, const CallContext& ctx) = 0;
  virtual domain::BrokerOrderResponse modifyOrder(
      const std::string& broker_order_id,
      const domain::OrderModification& modification,
      const CallContext& ctx) = 0;
  virtual domain::BrokerOrderDetails getOrderStatus(
      const std::string& broker_order_id, const CallContext& ctx) = 0;

  virtual domain::OrderBook getOrderBook(const CallContext& ctx) = 0;
  virtual std::vector<domain::BrokerPosition> getPositions(
      const CallContext& ctx) = 0;
  virtual std::vector<domain::Holding> getHoldings(const CallContext& ctx) = 0;

  virtual domain::Quote getQuote(const std::string& symbol,
                                 const CallContext& ctx) = 0;
  virtual void subscribeQuotes(const std::vector<std::string>& symbols,
                               const CallContext& ctx) = 0;
  virtual void unsubscribeQuotes(const std::vector<std::string>& symbols,
                                 const CallContext& ctx) = 0;

  virtual void setExecutionReportHandler(ExecutionReportHandler handler) = 0;

  // nullptr when the venue has no dealer capability.
  virtual IDealerOperations* dealerOperations() { return nullptr; }
};

}  // namespace orex

#pragma once

#include "orex/broker/broker_connector_factory.hpp"
#include "orex/broker/i_broker_connector.hpp"
#include "orex/broker/route_result.hpp"
#include "orex/errors/error_handler.hpp"
#include "orex/logging/logger.hpp"
#include "orex/resilience/call_context.hpp"
#include "orex/resilience/circuit_breaker_registry.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orex {

// What the router does when a venue has no dealer capability.
enum class DealerFallback {
  Account,  // run the single-account operation against the target client
  Reject,   // fail with Validation/InvalidParameter
};

const char* toString(DealerFallback policy);
std::optional<DealerFallback> parseDealerFallback(std::string_view text);

struct BrokerRouterOptions {
  DealerFallback dealer_fallback{DealerFallback::Account};

  // Deadline applied to a call whose CallContext carries none.
  std::chrono::milliseconds call_timeout{5000};
};

// -----------------------------------------------------------------------------
// BrokerRouter — connector pool, session map and guarded call path
// -----------------------------------------------------------------------------
//
// @brief  Resolves a user or client to a connector and runs one venue call
//         through the circuit breaker and the error classifier.
//
// @details
// Maps kept:
//   client_id → BrokerConfig                (registerBroker)
//   client_id → connector                   (lazy, built once by the factory)
//   user_id   → client_id                   (login / logout)
//
// Call path for every routed operation:
//
//   resolve client ── getBrokerClient ── breaker(destination).execute ──┐
//        │                  │                    │                      │
//        └──────────────────┴─────── ExecutionError ──> handleError ──> RouteResult
//
// The breaker is the one for config.destination, or the client ID when no
// destination is configured, so accounts on one venue share a breaker.
// Resolution failures ("no active session ...") pass through the
// classifier too and come back as Validation results.
//
// The classifier context is "<operation>:<key>" (e.g. "place:ord-7"). It is
// released when the call succeeds or when the decision is final, so a
// caller that retries keeps accumulating attempts on the same budget.
//
// Thread model:
//   All methods are thread-safe. Lookups take a shared lock; construction
//   re-checks under a unique lock so each client gets exactly one
//   connector. The connector observer and connector I/O run unlocked.
//
// Ownership:
//   Shares the factory; holds references to the breaker registry, the
//   classifier and the logger, which must outlive it.
// -----------------------------------------------------------------------------
class BrokerRouter {
 public:
  static constexpr const char* kComponent = "BrokerRouter";

  using ConnectorObserver = std::function<void(
      const std::string& client_id, const std::shared_ptr<IBrokerConnector>&)>;

  BrokerRouter(std::shared_ptr<BrokerConnectorFactory> factory,
               CircuitBreakerRegistry& breakers, IErrorHandler& errors,
               ILogger& logger, BrokerRouterOptions options = {});
  ~BrokerRouter();

  BrokerRouter(const BrokerRouter&) = delete;
  BrokerRouter& operator=(const BrokerRouter&) = delete;

  // -------------------------------------------------------------------------
  // Registration and lookup
  // -------------------------------------------------------------------------
  // registerBroker throws Validation/InvalidParameter for an empty client ID
  // or a config without a type. Re-registering replaces the config and
  // disconnects any cached connector.
  void registerBroker(const std::string& client_id,
                      const domain::BrokerConfig& config);

  // @throws ExecutionError Validation/InvalidParameter when the client is
  //         unknown or the factory fails.
  std::shared_ptr<IBrokerConnector> getBrokerClient(
      const std::string& client_id);

  // @throws ExecutionError Validation/InvalidParameter for an empty or
  //         unmapped user.
  std::string getClientIdForUser(const std::string& user_id) const;

  // Non-throwing form of getClientIdForUser().
  std::optional<std::string> sessionClient(const std::string& user_id) const;

  std::vector<std::string> registeredClients() const;
  std::string destinationFor(const std::string& client_id) const;

  // Called once for every connector the router constructs, under the
  // router lock and before any caller can obtain the connector. Must not
  // call back into the router.
  void setConnectorObserver(ConnectorObserver observer);

  // -------------------------------------------------------------------------
  // Sessions
  // -------------------------------------------------------------------------
  RouteResult<domain::Session> login(const std::string& client_id,
                                     const domain::Credentials& credentials,
                                     const CallContext& ctx = CallContext());
  RouteResult<Ack> logout(const std::string& client_id,
                          const CallContext& ctx = CallContext());

  // -------------------------------------------------------------------------
  // User-scoped operations
  // -------------------------------------------------------------------------
  RouteResult<domain::BrokerOrderResponse> placeOrder(
      const std::string& user_id, const domain::Order& order,
      const CallContext& ctx = CallContext());
  RouteResult<domain::BrokerOrderResponse> modifyOrder(
      const std::string& user_id, const std::string& broker_order_id,
      const domain::OrderModification& modification,
      const CallContext& ctx = CallContext());
  RouteResult<domain::BrokerOrderResponse> cancelOrder(
      const std::string& user_id, const std::string& broker_order_id,
      const CallContext& ctx = CallContext());
  RouteResult<domain::BrokerOrderDetails> getOrderStatus(
      const std::string& user_id, const std::string& broker_order_id,
      const CallContext& ctx = CallContext());
  RouteResult<domain::OrderBook> getOrderBook(
      const std::string& user_id, const CallContext& ctx = CallContext());
  RouteResult<std::vector<domain::BrokerPosition>> getPositions(
      const std::string& user_id, const CallContext& ctx = CallContext());
  RouteResult<std::vector<domain::Holding>> getHoldings(
      const std::string& user_id, const CallContext& ctx = CallContext());
  RouteResult<domain::Quote> getQuote(const std::string& user_id,
                                      const std::string& symbol,
                                      const CallContext& ctx = CallContext());
  RouteResult<Ack> subscribeQuotes(const std::string& user_id,
                                   const std::vector<std::string>& symbols,
                                   const CallContext& ctx = CallContext());
  RouteResult<Ack> unsubscribeQuotes(const std::string& user_id,
                                     const std::vector<std::string>& symbols,
                                     const CallContext& ctx = CallContext());

  // -------------------------------------------------------------------------
  // Dealer operations (user acts on target_client_id)
  // -------------------------------------------------------------------------
  RouteResult<domain::BrokerOrderResponse> placeDealerOrder(
      const std::string& user_id, const std::string& target_client_id,
      const domain::Order& order, const CallContext& ctx = CallContext());
  RouteResult<domain::OrderBook> getDealerOrderBook(
      const std::string& user_id, const std::string& target_client_id,
      const CallContext& ctx = CallContext());
  RouteResult<std::vector<domain::BrokerPosition>> getDealerPositions(
      const std::string& user_id, const std::string& target_client_id,
      const CallContext& ctx = CallContext());

  // Disconnects every cached connector and forgets sessions.
  void shutdown();

  const BrokerRouterOptions& options() const { return options_; }

 private:
  using ClientResolver = std::function<std::string()>;

  template <typename T, typename Fn>
  RouteResult<T> route(const std::string& context,
                       const ClientResolver& resolve, const CallContext& ctx,
                       Fn&& fn);

  // Picks the client a dealer call runs on; sets `fallback` when the
  // dealer's venue lacks the capability and the policy is Account.
  std::string resolveDealer(const std::string& user_id,
                            const std::string& target_client_id,
                            const char* operation, bool& fallback);

  CallContext effectiveContext(const CallContext& ctx) const;

  std::shared_ptr<BrokerConnectorFactory> factory_;
  CircuitBreakerRegistry& breakers_;
  IErrorHandler& errors_;
  ILogger& logger_;
  const BrokerRouterOptions options_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::BrokerConfig> configs_;
  std::unordered_map<std::string, std::shared_ptr<IBrokerConnector>> clients_;

  mutable std::shared_mutex session_mutex_;
  std::unordered_map<std::string, std::string> user_to_client_;

  std::mutex observer_mutex_;
  ConnectorObserver observer_;
};

}  // namespace orex

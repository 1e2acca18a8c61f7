#pragma once

#include "orex/broker/i_broker_connector.hpp"
#include "orex/errors/execution_error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orex::testing {

// -----------------------------------------------------------------------------
// FakeBrokerConnector — scripted venue for router and engine tests
// -----------------------------------------------------------------------------
// Calls succeed unless an error was queued with failNext() / failAlways().
// Queued errors are consumed by whichever operation runs next. Execution
// reports are delivered only when a test calls emit(), synchronously on the
// test's thread.
//
// holdPlacements() parks every placeOrder() call after it has been counted
// until releasePlacements(), so a test can act while a placement is in
// flight.
// -----------------------------------------------------------------------------
class FakeBrokerConnector final : public IBrokerConnector,
                                  public IDealerOperations {
 public:
  explicit FakeBrokerConnector(std::string client_id, bool dealer = false)
      : client_id_(std::move(client_id)), dealer_(dealer) {}

  void failNext(const ExecutionError& error, int times = 1) {
    std::lock_guard lock(mutex_);
    for (int i = 0; i < times; ++i) {
      failures_.push_back(error);
    }
  }

  void failAlways(const ExecutionError& error) {
    std::lock_guard lock(mutex_);
    always_.emplace(error);
  }

  void clearFailures() {
    std::lock_guard lock(mutex_);
    failures_.clear();
    always_.reset();
  }

  void setStatus(domain::BrokerOrderDetails details) {
    std::lock_guard lock(mutex_);
    status_ = std::move(details);
  }

  void holdPlacements() {
    std::lock_guard lock(gate_mutex_);
    held_ = true;
  }

  void releasePlacements() {
    {
      std::lock_guard lock(gate_mutex_);
      held_ = false;
    }
    gate_cv_.notify_all();
  }

  // @return false if no placement reached the gate within `timeout`.
  bool waitForBlockedPlacement(std::chrono::milliseconds timeout) {
    std::unique_lock lock(gate_mutex_);
    return gate_cv_.wait_for(lock, timeout, [this] { return blocked_ > 0; });
  }

  // Sends a report to whoever subscribed, as the venue would.
  void emit(const domain::ExecutionReport& report) {
    ExecutionReportHandler handler;
    {
      std::lock_guard lock(mutex_);
      handler = handler_;
    }
    if (handler) {
      handler(report);
    }
  }

  void connect(const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "connect");
    maybeFail();
    connected_.store(true);
    ++connects;
  }
  void disconnect() override {
    connected_.store(false);
    ++disconnects;
  }
  bool isConnected() const override { return connected_.load(); }

  domain::Session login(const domain::Credentials& credentials,
                        const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "login");
    maybeFail();
    ++logins;
    domain::Session session;
    session.token = "token-" + client_id_;
    session.user_id = credentials.user_id;
    session.client_id = client_id_;
    return session;
  }
  void logout(const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "logout");
    maybeFail();
    ++logouts;
  }

  domain::BrokerOrderResponse placeOrder(const domain::Order& order,
                                         const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "placeOrder");
    ++place_calls;
    waitAtGate();
    maybeFail();
    std::lock_guard lock(mutex_);
    placed_.push_back(order);
    domain::BrokerOrderResponse response;
    response.order_id = "FAKE-" + std::to_string(placed_.size());
    response.status = domain::OrderStatus::Open;
    return response;
  }

  domain::BrokerOrderResponse cancelOrder(const std::string& broker_order_id,
                                          const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "cancelOrder");
    ++cancel_calls;
    maybeFail();
    std::lock_guard lock(mutex_);
    cancelled_.push_back(broker_order_id);
    domain::BrokerOrderResponse response;
    response.order_id = broker_order_id;
    response.status = domain::OrderStatus::Cancelled;
    return response;
  }

  domain::BrokerOrderResponse modifyOrder(
      const std::string& broker_order_id,
      const domain::OrderModification& modification,
      const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "modifyOrder");
    ++modify_calls;
    maybeFail();
    std::lock_guard lock(mutex_);
    last_modification_ = modification;
    domain::BrokerOrderResponse response;
    response.order_id = broker_order_id;
    response.status = domain::OrderStatus::Open;
    return response;
  }

  domain::BrokerOrderDetails getOrderStatus(const std::string& broker_order_id,
                                            const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "getOrderStatus");
    maybeFail();
    std::lock_guard lock(mutex_);
    domain::BrokerOrderDetails details = status_;
    details.order_id = broker_order_id;
    return details;
  }

  domain::OrderBook getOrderBook(const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "getOrderBook");
    maybeFail();
    return domain::OrderBook{};
  }
  std::vector<domain::BrokerPosition> getPositions(
      const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "getPositions");
    maybeFail();
    return {};
  }
  std::vector<domain::Holding> getHoldings(const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "getHoldings");
    maybeFail();
    return {};
  }

  domain::Quote getQuote(const std::string& symbol,
                         const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "getQuote");
    maybeFail();
    domain::Quote quote;
    quote.symbol = symbol;
    quote.last_price = 100.0;
    return quote;
  }
  void subscribeQuotes(const std::vector<std::string>&,
                       const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "subscribeQuotes");
    maybeFail();
  }
  void unsubscribeQuotes(const std::vector<std::string>&,
                         const CallContext& ctx) override {
    ctx.throwIfDone("FakeBroker", "unsubscribeQuotes");
    maybeFail();
  }

  void setExecutionReportHandler(ExecutionReportHandler handler) override {
    std::lock_guard lock(mutex_);
    handler_ = std::move(handler);
  }

  IDealerOperations* dealerOperations() override {
    return dealer_ ? this : nullptr;
  }

  domain::BrokerOrderResponse placeDealerOrder(
      const std::string& target_client_id, const domain::Order& order,
      const CallContext& ctx) override {
    ++dealer_calls;
    {
      std::lock_guard lock(mutex_);
      dealer_targets_.push_back(target_client_id);
    }
    return placeOrder(order, ctx);
  }
  domain::OrderBook getDealerOrderBook(const std::string& target_client_id,
                                       const CallContext& ctx) override {
    ++dealer_calls;
    {
      std::lock_guard lock(mutex_);
      dealer_targets_.push_back(target_client_id);
    }
    return getOrderBook(ctx);
  }
  std::vector<domain::BrokerPosition> getDealerPositions(
      const std::string& target_client_id, const CallContext& ctx) override {
    ++dealer_calls;
    {
      std::lock_guard lock(mutex_);
      dealer_targets_.push_back(target_client_id);
    }
    return getPositions(ctx);
  }

  std::vector<domain::Order> placed() const {
    std::lock_guard lock(mutex_);
    return placed_;
  }
  std::vector<std::string> cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
  }
  std::vector<std::string> dealerTargets() const {
    std::lock_guard lock(mutex_);
    return dealer_targets_;
  }
  std::optional<domain::OrderModification> lastModification() const {
    std::lock_guard lock(mutex_);
    return last_modification_;
  }

  const std::string& clientId() const { return client_id_; }

  std::atomic<int> connects{0};
  std::atomic<int> disconnects{0};
  std::atomic<int> logins{0};
  std::atomic<int> logouts{0};
  std::atomic<int> place_calls{0};
  std::atomic<int> cancel_calls{0};
  std::atomic<int> modify_calls{0};
  std::atomic<int> dealer_calls{0};

 private:
  void waitAtGate() {
    std::unique_lock lock(gate_mutex_);
    if (!held_) {
      return;
    }
    ++blocked_;
    gate_cv_.notify_all();
    gate_cv_.wait(lock, [this] { return !held_; });
    --blocked_;
  }

  void maybeFail() {
    std::lock_guard lock(mutex_);
    if (!failures_.empty()) {
      ExecutionError error = failures_.front();
      failures_.pop_front();
      throw error;
    }
    if (always_) {
      throw *always_;
    }
  }

  const std::string client_id_;
  const bool dealer_;
  std::atomic<bool> connected_{false};

  mutable std::mutex mutex_;
  std::deque<ExecutionError> failures_;
  std::optional<ExecutionError> always_;
  domain::BrokerOrderDetails status_;
  std::vector<domain::Order> placed_;
  std::vector<std::string> cancelled_;
  std::vector<std::string> dealer_targets_;
  std::optional<domain::OrderModification> last_modification_;
  ExecutionReportHandler handler_;

  std::mutex gate_mutex_;
  std::condition_variable gate_cv_;
  bool held_{false};
  int blocked_{0};
};

}  // namespace orex::testing

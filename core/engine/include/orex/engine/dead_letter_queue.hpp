#pragma once

#include "orex/domain/order.hpp"
#include "orex/errors/execution_error.hpp"
#include "orex/logging/logger.hpp"
#include "orex/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orex {

// One order whose submission ran out of retries.
struct DeadLetter {
  domain::Order order;
  ExecutionError error;
  std::string user_id;
  int attempts{0};
  std::int64_t added_at_ms{0};
};

nlohmann::json toJson(const DeadLetter& letter);

// -----------------------------------------------------------------------------
// DeadLetterQueue — bounded parking lot for failed submissions
// -----------------------------------------------------------------------------
//
// @details
// Insertion-ordered. At capacity the oldest entry is dropped and a warning
// logged. Adding an order that is already present replaces the old entry
// and moves it to the back.
//
// Thread model: every method locks one mutex.
// -----------------------------------------------------------------------------
class DeadLetterQueue {
 public:
  static constexpr const char* kComponent = "DeadLetterQueue";

  DeadLetterQueue(std::size_t capacity, const ITimeProvider& clock,
                  ILogger& logger);

  DeadLetterQueue(const DeadLetterQueue&) = delete;
  DeadLetterQueue& operator=(const DeadLetterQueue&) = delete;

  void add(const domain::Order& order, const ExecutionError& error,
           const std::string& user_id = "", int attempts = 0);

  std::vector<DeadLetter> list() const;
  std::optional<DeadLetter> get(const domain::OrderId& order_id) const;

  // @return false if the order was not queued.
  bool remove(const domain::OrderId& order_id);

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  const ITimeProvider& clock_;
  ILogger& logger_;

  mutable std::mutex mutex_;
  std::deque<DeadLetter> letters_;
};

}  // namespace orex

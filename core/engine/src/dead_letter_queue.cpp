#include "orex/engine/dead_letter_queue.hpp"

#include "orex/domain/json_codec.hpp"

#include <algorithm>

namespace orex {

nlohmann::json toJson(const DeadLetter& letter) {
  nlohmann::json j;
  j["order"] = letter.order;
  j["error"] = letter.error.toJson();
  j["user_id"] = letter.user_id;
  j["attempts"] = letter.attempts;
  j["added_at_ms"] = letter.added_at_ms;
  return j;
}

DeadLetterQueue::DeadLetterQueue(std::size_t capacity,
                                 const ITimeProvider& clock, ILogger& logger)
    : capacity_(std::max<std::size_t>(capacity, 1)),
      clock_(clock),
      logger_(logger) {}

void DeadLetterQueue::add(const domain::Order& order,
                          const ExecutionError& error,
                          const std::string& user_id, int attempts) {
  std::lock_guard lock(mutex_);

  letters_.erase(std::remove_if(letters_.begin(), letters_.end(),
                                [&](const DeadLetter& l) {
                                  return l.order.id == order.id;
                                }),
                 letters_.end());

  if (letters_.size() >= capacity_) {
    logger_.warn(kComponent, "capacity reached, evicting oldest entry",
                 {{"evictedOrderId", letters_.front().order.id},
                  {"capacity", capacity_}});
    letters_.pop_front();
  }

  letters_.push_back(
      DeadLetter{order, error, user_id, attempts, clock_.now_ms()});

  logger_.error(kComponent, "order dead-lettered",
                {{"orderId", order.id},
                 {"attempts", attempts},
                 {"code", toString(error.code())},
                 {"reason", error.message()}});
}

std::vector<DeadLetter> DeadLetterQueue::list() const {
  std::lock_guard lock(mutex_);
  return {letters_.begin(), letters_.end()};
}

std::optional<DeadLetter> DeadLetterQueue::get(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(mutex_);
  for (const auto& letter : letters_) {
    if (letter.order.id == order_id) {
      return letter;
    }
  }
  return std::nullopt;
}

bool DeadLetterQueue::remove(const domain::OrderId& order_id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(letters_.begin(), letters_.end(),
                         [&](const DeadLetter& l) {
                           return l.order.id == order_id;
                         });
  if (it == letters_.end()) {
    return false;
  }
  letters_.erase(it);
  return true;
}

std::size_t DeadLetterQueue::size() const {
  std::lock_guard lock(mutex_);
  return letters_.size();
}

}  // namespace orex

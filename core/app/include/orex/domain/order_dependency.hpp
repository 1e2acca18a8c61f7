#pragma once

#include "orex/domain/order.hpp"
#include "orex/time/time_utils.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace orex {
namespace domain {

// -----------------------------------------------------------------------------
// DependencyType
// -----------------------------------------------------------------------------
//   OneTriggersOther  child is submitted once the parent completes; child is
//                     cancelled if the parent ends any other way.
//   OneCancelsOther   child is cancelled once the parent completes.
// -----------------------------------------------------------------------------
enum class DependencyType {
  OneTriggersOther,
  OneCancelsOther,
};

const char* toString(DependencyType type);
std::optional<DependencyType> parseDependencyType(std::string_view text);

// A directed parent → child edge.
struct OrderDependency {
  std::string id;              // "dep-<n>"
  OrderId parent_order_id;
  OrderId child_order_id;
  DependencyType type{DependencyType::OneTriggersOther};
  std::string condition;       // free-form, informational
  Timestamp created_at{};
};

}  // namespace domain
}  // namespace orex

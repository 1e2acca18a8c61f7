#pragma once

#include "orex/time/time_utils.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace orex {
namespace domain {

enum class RiskLimitType {
  OrderValue,     // price × quantity of a single order
  PositionSize,   // |projected position| after the order
  Margin,         // estimated margin of a single order
  OrderRate,      // orders per minute for the portfolio
  Exposure,       // projected position × price
  Leverage,       // projected exposure / portfolio capital
  Concentration,  // projected exposure / portfolio current value
  Drawdown,       // (peak - current) / peak of the portfolio
};

enum class RiskLevel {
  Low,
  Medium,
  High,
  Extreme,
};

const char* toString(RiskLimitType type);
const char* toString(RiskLevel level);
std::optional<RiskLimitType> parseRiskLimitType(std::string_view text);
std::optional<RiskLevel> parseRiskLevel(std::string_view text);

// One configurable ceiling. `description` is the human-readable prefix of
// the breach message ("Maximum order value: ...").
struct RiskLimit {
  RiskLimitType type{RiskLimitType::OrderValue};
  double value{0.0};
  RiskLevel level{RiskLevel::Medium};
  std::string description;
  bool enabled{true};
};

// -----------------------------------------------------------------------------
// RiskProfile — named set of limits a strategy opts into
// -----------------------------------------------------------------------------
// Limits are keyed by type, so a profile carries at most one limit of each
// kind. std::map keeps evaluation order stable across runs (declaration
// order of RiskLimitType).
// -----------------------------------------------------------------------------
struct RiskProfile {
  std::string id;
  std::string name;
  std::string description;
  std::map<RiskLimitType, RiskLimit> limits;
  Timestamp created_at{};
  Timestamp updated_at{};
};

}  // namespace domain
}  // namespace orex

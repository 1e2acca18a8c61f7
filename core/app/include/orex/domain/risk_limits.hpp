#pragma once

#include <cstdint>

namespace orex {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits — engine-wide hard risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Ceilings that apply to every order regardless of which risk
//         profile (if any) its strategy references.
//
// @details
// Used by the independent RiskManager checks (checkPositionLimits,
// checkMarginRequirements, checkRateLimits). Profile limits are evaluated
// on top of these, never instead of them.
//
// Margin estimate = order value × margin rate of the product type. Intraday
// positions are squared off the same day and only reserve a fraction of the
// notional; Normal and Delivery reserve the full value.
//
// Thread model:
//   Plain data, copied into RiskManager at construction. Loaded from the
//   "risk.limits" section of the engine config.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Maximum absolute net position per (portfolio, symbol), in units.
  std::int64_t max_position_size{10'000};

  /// Maximum price × quantity of a single order.
  double max_order_value{1'000'000.0};

  /// Orders recorded for one portfolio within the trailing 60 seconds must
  /// stay below this count.
  int max_orders_per_minute{120};

  double intraday_margin_rate{0.2};
  double normal_margin_rate{1.0};
  double delivery_margin_rate{1.0};
};

}  // namespace domain
}  // namespace orex

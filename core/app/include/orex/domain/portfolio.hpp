#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace orex {
namespace domain {

// Capital view of a portfolio at validation time. Supplied by the caller;
// the engine does not own portfolio accounting.
struct Portfolio {
  std::string id;
  std::string name;
  double capital{0.0};
  double available_margin{0.0};
  double peak_value{0.0};
  double current_value{0.0};
};

// -----------------------------------------------------------------------------
// Strategy
// -----------------------------------------------------------------------------
// risk_params is an open JSON object. Recognised keys:
//
//   "riskProfileId"   string  risk profile to evaluate
//   "maxOrderValue"   number  per-order value cap
//   "maxQuantity"     number  per-order quantity cap
//   "allowedSymbols"  array   whitelist; absent or empty means any symbol
// -----------------------------------------------------------------------------
struct Strategy {
  std::string id;
  std::string name;
  std::string portfolio_id;
  nlohmann::json risk_params = nlohmann::json::object();
};

// -----------------------------------------------------------------------------
// Position — signed net quantity per (portfolio, symbol)
// -----------------------------------------------------------------------------
// Sign convention for net_quantity:
//   positive → long, negative → short, zero → flat
// -----------------------------------------------------------------------------
struct Position {
  std::string portfolio_id;
  std::string symbol;
  std::int64_t net_quantity{0};
};

}  // namespace domain
}  // namespace orex

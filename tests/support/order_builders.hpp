#pragma once

#include "orex/domain/order.hpp"
#include "orex/domain/portfolio.hpp"

#include <cstdint>
#include <string>

namespace orex::testing {

// A small, valid limit buy that passes the default risk limits.
inline domain::Order makeOrder(const std::string& id,
                               const std::string& symbol = "INFY",
                               std::int64_t quantity = 10,
                               double price = 100.0) {
  domain::Order order;
  order.id = id;
  order.portfolio_id = "pf-1";
  order.strategy_id = "st-1";
  order.symbol = symbol;
  order.exchange = "NSE";
  order.order_type = domain::OrderType::Limit;
  order.product_type = domain::ProductType::Delivery;
  order.side = domain::Side::Buy;
  order.quantity = quantity;
  order.price = price;
  return order;
}

inline domain::Portfolio makePortfolio(double margin = 1'000'000.0) {
  domain::Portfolio portfolio;
  portfolio.id = "pf-1";
  portfolio.name = "Test book";
  portfolio.capital = margin;
  portfolio.available_margin = margin;
  portfolio.peak_value = margin;
  portfolio.current_value = margin;
  return portfolio;
}

inline domain::Strategy makeStrategy() {
  domain::Strategy strategy;
  strategy.id = "st-1";
  strategy.name = "Test strategy";
  strategy.portfolio_id = "pf-1";
  return strategy;
}

}  // namespace orex::testing

#pragma once

#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/primitives.hpp>
#include <string>

namespace liquidity::schema {

// One row of the account classification table: an inclusive account range
// mapped to a named category.
struct account_category_rule_t final {
  std::string name;
  account_range_t range{};
  cashflow_direction_t direction{cashflow_direction_t::outflow};
  std::string color;
};

struct account_category_t final {
  std::string name;
  cashflow_direction_t direction{cashflow_direction_t::outflow};
  std::string color;
};

}  // namespace liquidity::schema

#pragma once

#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/primitives.hpp>
#include <string>

// Schema type: cashflow category.
// Liquidity workflow: a category's contribution within a single projected
// week.
namespace liquidity::schema {

template <uint16_t Version>
struct cashflow_category;

template <>
struct cashflow_category<1> final {
  uint16_t version{1};
  std::string name;
  amount_t amount{};
  cashflow_direction_t direction{cashflow_direction_t::outflow};
  bool recurring{};
  double confidence{};
  account_range_t account_range{};
};

using cashflow_category_t = cashflow_category<1>;

}  // namespace liquidity::schema

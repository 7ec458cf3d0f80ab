#pragma once

#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/primitives.hpp>
#include <string>

// Schema type: category breakdown item.
// Liquidity workflow: a category's contribution summed over the whole
// horizon; `percentage` is relative to the total of the same direction.
namespace liquidity::schema {

template <uint16_t Version>
struct category_breakdown_item;

template <>
struct category_breakdown_item<1> final {
  uint16_t version{1};
  std::string name;
  amount_t total_amount{};
  cashflow_direction_t direction{cashflow_direction_t::outflow};
  amount_t weekly_average{};
  std::string color;
  double percentage{};
};

using category_breakdown_item_t = category_breakdown_item<1>;

}  // namespace liquidity::schema

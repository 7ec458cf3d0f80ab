#pragma once

#include <liquidity/schema/cashflow_category.hpp>
#include <liquidity/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: liquidity week.
// Liquidity workflow: one projected Monday-to-Sunday week. Weeks are chained,
// each opening balance equals the previous closing balance.
namespace liquidity::schema {

template <uint16_t Version>
struct liquidity_week;

template <>
struct liquidity_week<1> final {
  uint16_t version{1};
  uint32_t index{};
  uint32_t week_number{};
  uint32_t calendar_week{};
  date_t start_date{};
  date_t end_date{};
  amount_t opening_balance{};
  amount_t inflows{};
  amount_t outflows{};
  amount_t net_cashflow{};
  amount_t closing_balance{};
  double confidence{};
  amount_t lower_bound{};
  amount_t upper_bound{};
  std::vector<cashflow_category_t> categories;
};

using liquidity_week_t = liquidity_week<1>;

}  // namespace liquidity::schema

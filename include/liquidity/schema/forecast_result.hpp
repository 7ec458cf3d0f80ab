#pragma once

#include <liquidity/schema/category_breakdown_item.hpp>
#include <liquidity/schema/forecast_kpis.hpp>
#include <liquidity/schema/liquidity_alert.hpp>
#include <liquidity/schema/liquidity_week.hpp>
#include <liquidity/schema/primitives.hpp>
#include <liquidity/schema/recurring_pattern.hpp>
#include <string>
#include <vector>

// Schema type: forecast result.
// Liquidity workflow: everything one projection run produces. Stateless,
// identical inputs produce an identical result.
namespace liquidity::schema {

template <uint16_t Version>
struct forecast_result;

template <>
struct forecast_result<1> final {
  uint16_t version{1};
  date_t reference_date{};
  amount_t start_balance{};
  amount_t threshold{};
  uint32_t horizon_weeks{};
  std::vector<liquidity_week_t> weeks;
  std::vector<liquidity_alert_t> alerts;
  forecast_kpis_t kpis;
  std::vector<std::string> insights;
  std::vector<recurring_pattern_t> recurring_patterns;
  std::vector<category_breakdown_item_t> category_breakdown;
};

using forecast_result_t = forecast_result<1>;

}  // namespace liquidity::schema

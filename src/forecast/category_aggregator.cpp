#include <liquidity/forecast/category_aggregator.hpp>

#include <algorithm>
#include <iterator>
#include <map>
#include <string>
#include <utility>

using namespace liquidity::schema;

namespace liquidity::forecast {

namespace {

struct category_total_t final {
  amount_t total{};
  uint32_t weeks{};
};

}  // namespace

std::vector<category_breakdown_item_t> aggregate_category_breakdown(
    const std::vector<liquidity_week_t>& weeks,
    const account_categorizer& categorizer) {
  auto totals =
      std::map<std::pair<std::string, cashflow_direction_t>, category_total_t>{};
  for (const auto& week : weeks) {
    for (const auto& category : week.categories) {
      auto& entry = totals[{category.name, category.direction}];
      entry.total += category.amount;
      entry.weeks += 1;
    }
  }

  auto inflow_total = amount_t{};
  auto outflow_total = amount_t{};
  for (const auto& [key, entry] : totals) {
    if (key.second == cashflow_direction_t::inflow) {
      inflow_total += entry.total;
    } else {
      outflow_total += entry.total;
    }
  }

  auto breakdown = std::vector<category_breakdown_item_t>{};
  breakdown.reserve(totals.size());
  for (const auto& [key, entry] : totals) {
    auto direction_total = key.second == cashflow_direction_t::inflow
                               ? inflow_total
                               : outflow_total;
    auto percentage =
        direction_total > 0 ? (entry.total / direction_total) * 100.0 : 0.0;
    auto weekly_average =
        entry.weeks > 0 ? entry.total / static_cast<double>(entry.weeks) : 0.0;
    breakdown.push_back(category_breakdown_item_t{
        .name = key.first,
        .total_amount = round_currency(entry.total),
        .direction = key.second,
        .weekly_average = round_currency(weekly_average),
        .color = categorizer.color_of(key.first),
        .percentage = round_ratio(percentage)});
  }

  std::sort(std::begin(breakdown), std::end(breakdown),
            [](const category_breakdown_item_t& a,
               const category_breakdown_item_t& b) {
              if (a.total_amount != b.total_amount) {
                return a.total_amount > b.total_amount;
              }
              if (a.name != b.name) {
                return a.name < b.name;
              }
              return a.direction < b.direction;
            });
  return breakdown;
}

}  // namespace liquidity::forecast

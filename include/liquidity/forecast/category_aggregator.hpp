#pragma once

#include <liquidity/forecast/account_categorizer.hpp>
#include <liquidity/schema/category_breakdown_item.hpp>
#include <liquidity/schema/liquidity_week.hpp>
#include <vector>

namespace liquidity::forecast {

/// Sum every (category, direction) pair over the horizon.
///
/// Percentages are relative to the total of the same direction, the weekly
/// average divides by the number of weeks the category appeared in. Sorted by
/// total amount, largest first, ties by name.
std::vector<schema::category_breakdown_item_t> aggregate_category_breakdown(
    const std::vector<schema::liquidity_week_t>& weeks,
    const account_categorizer& categorizer);

}  // namespace liquidity::forecast

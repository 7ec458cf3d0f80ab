#include <liquidity/forecast/account_categorizer.hpp>

#include <cmath>
#include <utility>

using namespace liquidity::schema;

namespace liquidity::forecast {

namespace {

constexpr auto kUnknownCategoryColor = std::string_view{"#9ca3af"};

cashflow_direction_t opposite(const cashflow_direction_t direction) {
  return direction == cashflow_direction_t::inflow
             ? cashflow_direction_t::outflow
             : cashflow_direction_t::inflow;
}

}  // namespace

account_categorizer::account_categorizer()
    : options_{default_categorizer_options()} {}

account_categorizer::account_categorizer(categorizer_options_t options)
    : options_{std::move(options)} {}

account_category_t account_categorizer::categorize(
    const account_number_t account) const {
  for (const auto& rule : options_.rules) {
    if (account >= rule.range.first && account <= rule.range.second) {
      return account_category_t{
          .name = rule.name, .direction = rule.direction, .color = rule.color};
    }
  }
  if (account < options_.boundary_account) {
    return options_.fallback_revenue;
  }
  return options_.fallback_expense;
}

flow_t account_categorizer::flow_of(const booking_t& booking) const {
  auto direction = categorize(booking.account).direction;
  if (booking.amount < 0) {
    direction = opposite(direction);
  }
  return flow_t{.direction = direction, .amount = std::abs(booking.amount)};
}

std::string account_categorizer::color_of(
    const std::string_view category) const {
  for (const auto& rule : options_.rules) {
    if (rule.name == category) {
      return rule.color;
    }
  }
  if (options_.fallback_revenue.name == category) {
    return options_.fallback_revenue.color;
  }
  if (options_.fallback_expense.name == category) {
    return options_.fallback_expense.color;
  }
  return std::string{kUnknownCategoryColor};
}

}  // namespace liquidity::forecast

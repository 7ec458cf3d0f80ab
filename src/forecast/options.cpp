#include <liquidity/forecast/options.hpp>

#include <algorithm>
#include <iterator>

using namespace liquidity::schema;

namespace liquidity::forecast {

std::vector<account_category_rule_t> default_category_rules() {
  // First match wins; Energie shares the Raumkosten range and is only reached
  // through a custom table that lists it first.
  return {
      {"Erlöse", {8000, 8999}, cashflow_direction_t::inflow, "#10b981"},
      {"Personalkosten", {5000, 5999}, cashflow_direction_t::outflow,
       "#ef4444"},
      {"Materialkosten", {3000, 3999}, cashflow_direction_t::outflow,
       "#f59e0b"},
      {"Raumkosten", {4200, 4299}, cashflow_direction_t::outflow, "#8b5cf6"},
      {"Energie", {4200, 4249}, cashflow_direction_t::outflow, "#06b6d4"},
      {"Versicherungen", {4300, 4399}, cashflow_direction_t::outflow,
       "#ec4899"},
      {"Abschreibungen", {4800, 4899}, cashflow_direction_t::outflow,
       "#6b7280"},
      {"Sonstige Aufwendungen", {6000, 6999}, cashflow_direction_t::outflow,
       "#a855f7"},
      {"Steuern", {7000, 7999}, cashflow_direction_t::outflow, "#dc2626"},
  };
}

std::vector<frequency_band_t> default_frequency_bands() {
  return {
      {recurrence_frequency_t::weekly, 40.0, std::nullopt, 52.0, 1},
      {recurrence_frequency_t::biweekly, 20.0, 40.0, 26.0, 2},
      {recurrence_frequency_t::monthly, 10.0, 14.0, 12.0, 4},
      {recurrence_frequency_t::quarterly, 3.0, 5.0, 4.0, 13},
  };
}

categorizer_options_t default_categorizer_options() {
  auto options = categorizer_options_t{};
  options.rules = default_category_rules();
  options.boundary_account = 5000;
  options.fallback_revenue = account_category_t{
      .name = "Sonstige Erlöse",
      .direction = cashflow_direction_t::inflow,
      .color = "#34d399"};
  options.fallback_expense = account_category_t{
      .name = "Sonstige Aufwendungen",
      .direction = cashflow_direction_t::outflow,
      .color = "#9ca3af"};
  return options;
}

pattern_options_t default_pattern_options() {
  auto options = pattern_options_t{};
  options.bands = default_frequency_bands();
  return options;
}

forecast_options_t default_forecast_options() {
  auto options = forecast_options_t{};
  options.categorizer = default_categorizer_options();
  options.patterns = default_pattern_options();
  return options;
}

const frequency_band_t* find_band(const std::vector<frequency_band_t>& bands,
                                  const recurrence_frequency_t frequency) {
  auto it = std::find_if(std::begin(bands), std::end(bands),
                         [&](const frequency_band_t& band) {
                           return band.frequency == frequency;
                         });
  if (it == std::end(bands)) {
    return nullptr;
  }
  return &*it;
}

}  // namespace liquidity::forecast

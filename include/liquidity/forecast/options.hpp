#pragma once

#include <liquidity/schema/account_category.hpp>
#include <liquidity/schema/primitives.hpp>
#include <liquidity/schema/recurrence_frequency.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace liquidity::forecast {

/// Annualized-rate band that maps an observed occurrence rate to a frequency.
///
/// `min_rate` is inclusive, `max_rate` exclusive; an empty `max_rate` means
/// unbounded. `cadence_weeks` controls in which projected weeks a pattern of
/// this frequency is booked (every week index divisible by it).
struct frequency_band_t final {
  schema::recurrence_frequency_t frequency{
      schema::recurrence_frequency_t::monthly};
  double min_rate{};
  std::optional<double> max_rate;
  double nominal_rate{1.0};
  uint32_t cadence_weeks{1};
};

struct day_window_t final {
  uint32_t first_day{1};
  uint32_t last_day{1};

  bool contains(const uint32_t day) const {
    return day >= first_day && day <= last_day;
  }
};

struct categorizer_options_t final {
  std::vector<schema::account_category_rule_t> rules;
  // Accounts below this number fall back to revenue, the rest to expense.
  schema::account_number_t boundary_account{5000};
  schema::account_category_t fallback_revenue;
  schema::account_category_t fallback_expense;
};

struct pattern_options_t final {
  uint32_t min_occurrences{2};
  int32_t recent_window_days{30};
  // Multiplier from the recent-window count to an annual rate.
  double periods_per_year{12.0};
  std::vector<frequency_band_t> bands;
};

struct baseline_options_t final {
  int32_t window_days{30};
  double weeks_per_window{4.3};
};

struct variance_options_t final {
  schema::amount_t fallback_std_dev{5'000.0};
  double widening_per_week{0.1};
};

struct confidence_options_t final {
  double decay_per_week{0.045};
  double floor{0.4};
};

struct overlay_options_t final {
  double factor{0.5};
  day_window_t payroll_days{25, 28};
  day_window_t rent_days{1, 5};
  std::string payroll_category{"Personalkosten"};
  std::string rent_category{"Raumkosten"};
};

struct alert_options_t final {
  // Week-over-week net cashflow below this raises an info alert.
  schema::amount_t large_drop{-10'000.0};
};

inline constexpr auto kDefaultMaxHorizonWeeks = uint32_t{520};

struct horizon_options_t final {
  // Longest accepted projection; longer requests are invalid_horizon.
  uint32_t max_weeks{kDefaultMaxHorizonWeeks};
};

struct insight_options_t final {
  std::size_t max_count{5};
};

struct forecast_options_t final {
  categorizer_options_t categorizer;
  pattern_options_t patterns;
  baseline_options_t baseline;
  variance_options_t variance;
  confidence_options_t confidence;
  overlay_options_t overlays;
  alert_options_t alerts;
  insight_options_t insights;
  horizon_options_t horizon;
};

std::vector<schema::account_category_rule_t> default_category_rules();
std::vector<frequency_band_t> default_frequency_bands();
categorizer_options_t default_categorizer_options();
pattern_options_t default_pattern_options();
forecast_options_t default_forecast_options();

const frequency_band_t* find_band(const std::vector<frequency_band_t>& bands,
                                  schema::recurrence_frequency_t frequency);

}  // namespace liquidity::forecast

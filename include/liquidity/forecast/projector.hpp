#pragma once

#include <liquidity/forecast/account_categorizer.hpp>
#include <liquidity/forecast/options.hpp>
#include <liquidity/schema/booking.hpp>
#include <liquidity/schema/cashflow_category.hpp>
#include <liquidity/schema/config_error_code.hpp>
#include <liquidity/schema/forecast_config.hpp>
#include <liquidity/schema/forecast_result.hpp>
#include <liquidity/schema/recurring_pattern.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liquidity::forecast {

/// Check a run configuration before any projection work is done.
///
/// Returns the first violation in this order: missing reference date,
/// non-finite or out-of-range start balance, horizon outside
/// `1..max_weeks`, non-finite, non-positive or out-of-range threshold.
/// Amounts are out of range at `schema::kMaxAmount` and beyond.
std::optional<schema::config_error_code> validate_config(
    const schema::forecast_config_t& config,
    uint32_t max_weeks = kDefaultMaxHorizonWeeks);

std::string_view describe(schema::config_error_code code);

/// Week-by-week cash position simulation.
///
/// The projector is deterministic: it never reads a clock, holds no mutable
/// state and produces identical results for identical inputs, so one
/// instance can serve concurrent callers.
class projector final {
 public:
  projector();
  explicit projector(forecast_options_t options);

  /// Project `config.weeks` weeks starting with the week that contains
  /// `config.now`.
  ///
  /// On invalid configuration returns an empty optional and stores a
  /// human-readable reason in `error`. Any booking history, including an
  /// empty one, is accepted.
  std::optional<schema::forecast_result_t> project(
      const std::vector<schema::booking_t>& bookings,
      const schema::forecast_config_t& config,
      std::string& error) const;

  const forecast_options_t& options() const { return options_; }
  const account_categorizer& categorizer() const { return categorizer_; }

 private:
  /// Whether a pattern is booked in the week with the given index.
  bool includes_pattern(const schema::recurring_pattern_t& pattern,
                        uint32_t week_index) const;

  /// Extra outflow from monthly outflow patterns of one category, applied
  /// when a week starts inside that category's day-of-month window.
  schema::amount_t calendar_overlay(
      const std::vector<schema::recurring_pattern_t>& patterns,
      std::string_view category) const;

  std::vector<schema::cashflow_category_t> build_week_categories(
      const std::vector<schema::booking_t>& bookings,
      const std::vector<schema::recurring_pattern_t>& patterns,
      schema::date_t start,
      schema::date_t end,
      uint32_t week_index) const;

  forecast_options_t options_;
  account_categorizer categorizer_;
};

}  // namespace liquidity::forecast

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <liquidity/forecast/alert_generator.hpp>
#include <liquidity/forecast/calendar.hpp>
#include <liquidity/forecast/category_aggregator.hpp>
#include <liquidity/forecast/insight_narrator.hpp>
#include <liquidity/forecast/pattern_detector.hpp>
#include <liquidity/forecast/projector.hpp>
#include <liquidity/forecast/variance_estimator.hpp>
#include <map>
#include <utility>

using namespace liquidity::schema;

namespace liquidity::forecast {

std::optional<config_error_code> validate_config(
    const forecast_config_t& config,
    const uint32_t max_weeks) {
  if (!config.now.has_value()) {
    return config_error_code::missing_reference_date;
  }
  if (!std::isfinite(config.start_balance) ||
      std::abs(config.start_balance) >= kMaxAmount) {
    return config_error_code::invalid_start_balance;
  }
  if (config.weeks <= 0 || static_cast<uint32_t>(config.weeks) > max_weeks) {
    return config_error_code::invalid_horizon;
  }
  if (!std::isfinite(config.threshold) || config.threshold <= 0 ||
      config.threshold >= kMaxAmount) {
    return config_error_code::invalid_threshold;
  }
  return std::nullopt;
}

std::string_view describe(const config_error_code code) {
  switch (code) {
    case config_error_code::missing_reference_date:
      return "reference date is required";
    case config_error_code::invalid_start_balance:
      return "start balance must be a finite number within the currency range";
    case config_error_code::invalid_horizon:
      return "weeks must be positive and within the horizon limit";
    case config_error_code::invalid_threshold:
      return "threshold must be a positive number within the currency range";
  }
  return "unknown configuration error";
}

projector::projector() : projector(default_forecast_options()) {}

projector::projector(forecast_options_t options)
    : options_{std::move(options)}, categorizer_{options_.categorizer} {}

bool projector::includes_pattern(const recurring_pattern_t& pattern,
                                 const uint32_t week_index) const {
  const auto* band = find_band(options_.patterns.bands, pattern.frequency);
  if (band == nullptr || band->cadence_weeks == 0) {
    return false;
  }
  return (week_index % band->cadence_weeks) == 0;
}

amount_t projector::calendar_overlay(
    const std::vector<recurring_pattern_t>& patterns,
    const std::string_view category) const {
  auto overlay = amount_t{};
  for (const auto& pattern : patterns) {
    if (pattern.direction == cashflow_direction_t::outflow &&
        pattern.frequency == recurrence_frequency_t::monthly &&
        pattern.category == category) {
      overlay += pattern.average_amount *
                 (pattern.confidence * options_.overlays.factor);
    }
  }
  return overlay;
}

std::vector<cashflow_category_t> projector::build_week_categories(
    const std::vector<booking_t>& bookings,
    const std::vector<recurring_pattern_t>& patterns,
    const date_t start,
    const date_t end,
    const uint32_t week_index) const {
  auto categories =
      std::map<std::pair<std::string, cashflow_direction_t>,
               cashflow_category_t>{};

  for (const auto& booking : bookings) {
    if (booking.posting_date < start || booking.posting_date > end) {
      continue;
    }
    auto category = categorizer_.categorize(booking.account);
    auto flow = categorizer_.flow_of(booking);
    auto [it, inserted] = categories.try_emplace(
        {category.name, flow.direction},
        cashflow_category_t{
            .name = category.name,
            .direction = flow.direction,
            .account_range = account_range_t{booking.account, booking.account}});
    auto& entry = it->second;
    if (!inserted) {
      entry.account_range.first =
          std::min(entry.account_range.first, booking.account);
      entry.account_range.second =
          std::max(entry.account_range.second, booking.account);
    }
    entry.amount += flow.amount;

    auto description = normalize_description(booking.text);
    for (const auto& pattern : patterns) {
      if (pattern.category == category.name &&
          pattern.description == description) {
        entry.recurring = true;
        entry.confidence = std::max(entry.confidence, pattern.confidence);
      }
    }
  }

  for (const auto& pattern : patterns) {
    if (!includes_pattern(pattern, week_index)) {
      continue;
    }
    auto [it, inserted] = categories.try_emplace(
        {pattern.category, pattern.direction},
        cashflow_category_t{.name = pattern.category,
                            .direction = pattern.direction,
                            .account_range = pattern.account_range});
    auto& entry = it->second;
    entry.amount += pattern.average_amount * pattern.confidence;
    entry.recurring = true;
    entry.confidence = std::max(entry.confidence, pattern.confidence);
  }

  auto out = std::vector<cashflow_category_t>{};
  out.reserve(categories.size());
  for (auto& [key, category] : categories) {
    category.amount = round_currency(category.amount);
    out.push_back(std::move(category));
  }
  return out;
}

std::optional<forecast_result_t> projector::project(
    const std::vector<booking_t>& bookings,
    const forecast_config_t& config,
    std::string& error) const {
  if (auto code = validate_config(config, options_.horizon.max_weeks)) {
    error = std::string{describe(*code)};
    spdlog::warn("Rejecting forecast configuration: {}", error);
    return std::nullopt;
  }

  const auto now = *config.now;
  const auto horizon = static_cast<uint32_t>(config.weeks);
  spdlog::info("Projecting {} week(s) from {} over {} booking(s)", horizon,
               format_date(now), bookings.size());

  auto detector = pattern_detector{categorizer_, options_.patterns};
  auto patterns = detector.detect(bookings, now);
  auto baseline =
      trailing_weekly_baseline(bookings, now, categorizer_, options_.baseline);
  auto std_dev = historical_std_dev(bookings, categorizer_, options_.variance);
  spdlog::debug(
      "Baseline inflow {} outflow {} per week, historical std dev {:.2f}",
      baseline.inflows, baseline.outflows, std_dev);

  auto result = forecast_result_t{};
  result.reference_date = now;
  result.start_balance = round_currency(config.start_balance);
  result.threshold = round_currency(config.threshold);
  result.horizon_weeks = horizon;
  result.weeks.reserve(horizon);

  const auto first_monday = monday_of(now);
  auto opening = config.start_balance;
  auto min_balance = config.start_balance;
  auto min_balance_week = std::optional<uint32_t>{};
  auto total_inflow = amount_t{};
  auto total_outflow = amount_t{};

  for (auto index = uint32_t{0}; index < horizon; ++index) {
    auto start = first_monday + std::chrono::days{7 * index};
    auto end = start + std::chrono::days{6};
    auto calendar_week = iso_week(start).week;
    auto confidence =
        std::max(options_.confidence.floor,
                 1.0 - (static_cast<double>(index) *
                        options_.confidence.decay_per_week));

    auto inflows = baseline.inflows;
    auto outflows = baseline.outflows;

    auto start_day = day_of_month(start);
    if (options_.overlays.payroll_days.contains(start_day)) {
      outflows += calendar_overlay(patterns, options_.overlays.payroll_category);
    }
    if (options_.overlays.rent_days.contains(start_day)) {
      outflows += calendar_overlay(patterns, options_.overlays.rent_category);
    }

    for (const auto& pattern : patterns) {
      if (!includes_pattern(pattern, index)) {
        continue;
      }
      auto amount = pattern.average_amount * pattern.confidence;
      if (pattern.direction == cashflow_direction_t::inflow) {
        inflows += amount;
      } else {
        outflows += amount;
      }
    }

    inflows = round_currency(inflows);
    outflows = round_currency(outflows);
    auto net = inflows - outflows;
    auto closing = opening + net;
    auto half_width =
        std_dev *
        (1.0 + (static_cast<double>(index) * options_.variance.widening_per_week));

    auto week = liquidity_week_t{};
    week.index = index;
    week.week_number = index + 1;
    week.calendar_week = calendar_week;
    week.start_date = start;
    week.end_date = end;
    week.opening_balance = round_currency(opening);
    week.inflows = inflows;
    week.outflows = outflows;
    week.net_cashflow = round_currency(net);
    week.closing_balance = round_currency(closing);
    week.confidence = round_ratio(confidence);
    week.lower_bound = round_currency(closing - half_width);
    week.upper_bound = round_currency(closing + half_width);
    week.categories =
        build_week_categories(bookings, patterns, start, end, index);
    result.weeks.push_back(std::move(week));

    if (closing < min_balance) {
      min_balance = closing;
      min_balance_week = calendar_week;
    }
    total_inflow += inflows;
    total_outflow += outflows;
    opening = closing;
  }

  auto burn_rate = round_currency((total_outflow - total_inflow) /
                                  static_cast<double>(horizon));
  auto runway = std::optional<double>{};
  if (burn_rate > 0) {
    runway = round_ratio(std::max(0.0, min_balance / burn_rate));
  }

  result.kpis = forecast_kpis_t{
      .current_balance = round_currency(config.start_balance),
      .min_balance = round_currency(min_balance),
      .min_balance_week = min_balance_week,
      .burn_rate = burn_rate,
      .runway_weeks = runway,
      .avg_weekly_inflow = baseline.inflows,
      .avg_weekly_outflow = baseline.outflows,
      .total_projected_inflow = round_currency(total_inflow),
      .total_projected_outflow = round_currency(total_outflow)};
  result.alerts =
      generate_alerts(result.weeks, config.threshold, options_.alerts);
  result.recurring_patterns = std::move(patterns);
  result.category_breakdown =
      aggregate_category_breakdown(result.weeks, categorizer_);
  result.insights = narrate_insights(result, options_);

  spdlog::info(
      "Forecast ready: {} week(s), {} alert(s), {} pattern(s), minimum "
      "balance {:.2f}",
      result.weeks.size(), result.alerts.size(),
      result.recurring_patterns.size(), result.kpis.min_balance);
  return result;
}

}  // namespace liquidity::forecast

#include <liquidity/forecast/calendar.hpp>
#include <liquidity/forecast/insight_narrator.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <utility>

using namespace liquidity::schema;

namespace {

using liquidity::forecast::forecast_options_t;

std::optional<std::string> payroll_insight(const forecast_result_t& result,
                                           const forecast_options_t& options) {
  auto pattern = std::find_if(
      std::begin(result.recurring_patterns), std::end(result.recurring_patterns),
      [&](const recurring_pattern_t& p) {
        return p.direction == cashflow_direction_t::outflow &&
               p.frequency == recurrence_frequency_t::monthly &&
               p.category == options.overlays.payroll_category;
      });
  if (pattern == std::end(result.recurring_patterns)) {
    return std::nullopt;
  }

  auto payday = liquidity::forecast::next_day_of_month(
      result.reference_date, pattern->typical_day_of_month);
  auto week = std::find_if(std::begin(result.weeks), std::end(result.weeks),
                           [&](const liquidity_week_t& w) {
                             return payday >= w.start_date &&
                                    payday <= w.end_date;
                           });
  if (week == std::end(result.weeks)) {
    return std::nullopt;
  }
  return fmt::format(
      "Payroll in CW {} is expected to leave a balance of {}",
      week->calendar_week, format_currency(week->closing_balance));
}

std::string runway_insight(const forecast_result_t& result) {
  const auto& runway = result.kpis.runway_weeks;
  if (runway.has_value() &&
      *runway < static_cast<double>(result.horizon_weeks)) {
    return fmt::format(
        "Liquidity buffer lasts {:.1f} weeks at the current burn rate",
        std::round(*runway * 10.0) / 10.0);
  }
  return fmt::format("Liquidity position is stable over the {}-week horizon",
                     result.horizon_weeks);
}

std::optional<std::string> cost_driver_insight(
    const forecast_result_t& result) {
  auto top = std::optional<category_breakdown_item_t>{};
  for (const auto& item : result.category_breakdown) {
    if (item.direction != cashflow_direction_t::outflow) {
      continue;
    }
    if (!top.has_value() || item.total_amount > top->total_amount) {
      top = item;
    }
  }
  if (!top.has_value()) {
    return std::nullopt;
  }
  return fmt::format("Primary cost driver: {} ({}% of outflows)", top->name,
                     std::lround(top->percentage));
}

std::optional<std::string> trend_insight(const forecast_result_t& result) {
  const auto& weeks = result.weeks;
  auto split = (weeks.size() + 1) / 2;
  if (split == 0 || split >= weeks.size()) {
    return std::nullopt;
  }

  auto average_closing = [&](const std::size_t first, const std::size_t last) {
    auto sum = amount_t{};
    for (auto i = first; i < last; ++i) {
      sum += weeks[i].closing_balance;
    }
    return sum / static_cast<double>(last - first);
  };
  auto first_half = average_closing(0, split);
  auto second_half = average_closing(split, weeks.size());

  auto change = round_currency(second_half - first_half);
  if (change < 0) {
    return fmt::format(
        "Trend: balance declines in the second half of the horizon, average "
        "decrease {}",
        format_currency(-change));
  }
  if (change > 0) {
    return fmt::format(
        "Trend: balance recovers in the second half of the horizon, average "
        "improvement {}",
        format_currency(change));
  }
  return std::nullopt;
}

std::string outflow_ratio_insight(const forecast_result_t& result) {
  auto inflow = result.kpis.total_projected_inflow;
  auto outflow = result.kpis.total_projected_outflow;
  auto ratio = inflow > 0 ? (outflow / inflow) * 100.0 : 100.0;
  return fmt::format(
      "Outflow ratio: projected outflows amount to {}% of projected inflows",
      std::lround(ratio));
}

}  // namespace

namespace liquidity::forecast {

std::vector<std::string> narrate_insights(const forecast_result_t& result,
                                          const forecast_options_t& options) {
  auto insights = std::vector<std::string>{};
  if (auto payroll = payroll_insight(result, options)) {
    insights.push_back(std::move(*payroll));
  }
  insights.push_back(runway_insight(result));
  if (auto driver = cost_driver_insight(result)) {
    insights.push_back(std::move(*driver));
  }
  if (auto trend = trend_insight(result)) {
    insights.push_back(std::move(*trend));
  }
  insights.push_back(outflow_ratio_insight(result));

  if (insights.size() > options.insights.max_count) {
    insights.resize(options.insights.max_count);
  }
  return insights;
}

}  // namespace liquidity::forecast

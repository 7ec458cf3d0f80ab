#include <gtest/gtest.h>
#include <liquidity/forecast/calendar.hpp>
#include <liquidity/forecast/insight_narrator.hpp>
#include <liquidity/testing/common.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace liquidity::schema;
using namespace liquidity::forecast;
using liquidity::testing::make_date;

namespace {

forecast_result_t make_result(const std::vector<amount_t>& closings) {
  auto result = forecast_result_t{};
  result.reference_date = make_date(2024, 3, 1);
  result.horizon_weeks = static_cast<uint32_t>(closings.size());
  auto monday = monday_of(result.reference_date);
  for (std::size_t i = 0; i < closings.size(); ++i) {
    auto week = liquidity_week_t{};
    week.index = static_cast<uint32_t>(i);
    week.start_date = monday + std::chrono::days{7 * static_cast<int>(i)};
    week.end_date = week.start_date + std::chrono::days{6};
    week.calendar_week = iso_week(week.start_date).week;
    week.closing_balance = closings[i];
    result.weeks.push_back(week);
  }
  return result;
}

recurring_pattern_t make_payroll_pattern() {
  auto pattern = recurring_pattern_t{};
  pattern.description = "gehalt";
  pattern.average_amount = 5'000.0;
  pattern.frequency = recurrence_frequency_t::monthly;
  pattern.typical_day_of_month = 26;
  pattern.confidence = 1.0;
  pattern.occurrences = 2;
  pattern.direction = cashflow_direction_t::outflow;
  pattern.category = "Personalkosten";
  return pattern;
}

}  // namespace

TEST(insight_narrator, flat_result_reports_stability_and_ratio) {
  auto result = make_result({100'000.0, 100'000.0, 100'000.0, 100'000.0});
  auto insights = narrate_insights(result, default_forecast_options());
  ASSERT_EQ(insights.size(), 2u);
  EXPECT_EQ(insights[0], "Liquidity position is stable over the 4-week horizon");
  EXPECT_EQ(insights[1],
            "Outflow ratio: projected outflows amount to 100% of projected "
            "inflows");
}

TEST(insight_narrator, declining_result_reports_every_observation) {
  auto result = make_result(
      {90'000.0, 80'000.0, 70'000.0, 60'000.0, 50'000.0, 40'000.0});
  result.recurring_patterns.push_back(make_payroll_pattern());
  result.kpis.runway_weeks = 3.24;
  result.kpis.total_projected_inflow = 1'000.0;
  result.kpis.total_projected_outflow = 2'500.0;
  result.category_breakdown.push_back(category_breakdown_item_t{
      .name = "Raumkosten",
      .total_amount = 1'500.0,
      .direction = cashflow_direction_t::outflow,
      .percentage = 15.79});
  result.category_breakdown.push_back(category_breakdown_item_t{
      .name = "Personalkosten",
      .total_amount = 8'000.0,
      .direction = cashflow_direction_t::outflow,
      .percentage = 84.21});
  result.category_breakdown.push_back(category_breakdown_item_t{
      .name = "Erlöse",
      .total_amount = 9'000.0,
      .direction = cashflow_direction_t::inflow,
      .percentage = 100.0});

  auto insights = narrate_insights(result, default_forecast_options());
  ASSERT_EQ(insights.size(), 5u);
  EXPECT_EQ(insights[0],
            "Payroll in CW 13 is expected to leave a balance of EUR 50,000.00");
  EXPECT_EQ(insights[1],
            "Liquidity buffer lasts 3.2 weeks at the current burn rate");
  EXPECT_EQ(insights[2], "Primary cost driver: Personalkosten (84% of outflows)");
  EXPECT_EQ(insights[3],
            "Trend: balance declines in the second half of the horizon, "
            "average decrease EUR 30,000.00");
  EXPECT_EQ(insights[4],
            "Outflow ratio: projected outflows amount to 250% of projected "
            "inflows");

  auto options = default_forecast_options();
  options.insights.max_count = 2;
  auto capped = narrate_insights(result, options);
  ASSERT_EQ(capped.size(), 2u);
  EXPECT_EQ(capped[0], insights[0]);
  EXPECT_EQ(capped[1], insights[1]);
}

TEST(insight_narrator, trend_splits_odd_horizons_after_the_middle) {
  auto result = make_result({100.0, 200.0, 400.0});
  auto insights = narrate_insights(result, default_forecast_options());
  ASSERT_EQ(insights.size(), 3u);
  EXPECT_EQ(insights[1],
            "Trend: balance recovers in the second half of the horizon, "
            "average improvement EUR 250.00");
}

TEST(insight_narrator, runway_beyond_horizon_counts_as_stable) {
  auto result = make_result({100.0, 100.0});
  result.kpis.runway_weeks = 2.0;
  auto insights = narrate_insights(result, default_forecast_options());
  EXPECT_EQ(insights[0], "Liquidity position is stable over the 2-week horizon");
}

TEST(insight_narrator, payroll_outside_horizon_is_skipped) {
  auto result = make_result({100.0, 100.0});
  result.recurring_patterns.push_back(make_payroll_pattern());
  auto insights = narrate_insights(result, default_forecast_options());
  ASSERT_EQ(insights.size(), 2u);
  EXPECT_EQ(insights[0].rfind("Liquidity position", 0), 0u);
}

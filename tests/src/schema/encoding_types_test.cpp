#include <gtest/gtest.h>
#include <liquidity/forecast/fingerprint.hpp>
#include <liquidity/schema/encoding/scale/encoder.hpp>
#include <liquidity/schema/forecast_result.hpp>
#include <liquidity/testing/common.hpp>

#include <string>
#include <vector>

using namespace liquidity::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

forecast_result_t make_result() {
  auto result = forecast_result_t{};
  result.reference_date = liquidity::testing::make_date(2024, 3, 1);
  result.start_balance = 100'000.0;
  result.threshold = 50'000.0;
  result.horizon_weeks = 1;

  auto week = liquidity_week_t{};
  week.index = 0;
  week.week_number = 1;
  week.calendar_week = 9;
  week.start_date = liquidity::testing::make_date(2024, 2, 26);
  week.end_date = liquidity::testing::make_date(2024, 3, 3);
  week.opening_balance = 100'000.0;
  week.outflows = 8'662.79;
  week.net_cashflow = -8'662.79;
  week.closing_balance = 91'337.21;
  week.confidence = 1.0;
  week.lower_bound = 86'337.21;
  week.upper_bound = 96'337.21;
  week.categories.push_back(cashflow_category_t{
      .name = "Personalkosten",
      .amount = 10'000.0,
      .direction = cashflow_direction_t::outflow,
      .recurring = true,
      .confidence = 1.0,
      .account_range = {5000, 5099}});
  result.weeks.push_back(week);

  result.alerts.push_back(liquidity_alert_t{
      .calendar_week = 9,
      .severity = alert_severity_t::warning,
      .message = "CW 9: balance below threshold, EUR 1.00 expected",
      .projected_balance = 1.0});

  result.kpis.current_balance = 100'000.0;
  result.kpis.min_balance = 91'337.21;
  result.kpis.min_balance_week = 9;
  result.kpis.burn_rate = 8'662.79;
  result.kpis.runway_weeks = 10.54;

  result.insights = {"Liquidity buffer lasts 10.5 weeks at the current burn rate"};

  auto pattern = recurring_pattern_t{};
  pattern.description = "gehalt";
  pattern.counterparty = "Staff";
  pattern.average_amount = 5'000.0;
  pattern.frequency = recurrence_frequency_t::monthly;
  pattern.typical_day_of_month = 26;
  pattern.confidence = 0.92;
  pattern.occurrences = 2;
  pattern.direction = cashflow_direction_t::outflow;
  pattern.category = "Personalkosten";
  pattern.account_range = {5000, 5099};
  result.recurring_patterns.push_back(pattern);

  result.category_breakdown.push_back(category_breakdown_item_t{
      .name = "Personalkosten",
      .total_amount = 10'000.0,
      .direction = cashflow_direction_t::outflow,
      .weekly_average = 10'000.0,
      .color = "#ef4444",
      .percentage = 100.0});
  return result;
}

}  // namespace

TEST(encoding_types, forecast_result_round_trips) {
  auto encoder = encoder_t{};
  auto result = make_result();
  auto encoded = encoder.encode(result);
  auto decoded = encoder.decode<forecast_result_t>(bytes_view_t{encoded});

  EXPECT_EQ(decoded.reference_date, result.reference_date);
  ASSERT_EQ(decoded.weeks.size(), 1u);
  EXPECT_DOUBLE_EQ(decoded.weeks[0].closing_balance, 91'337.21);
  EXPECT_EQ(decoded.weeks[0].start_date, result.weeks[0].start_date);
  ASSERT_EQ(decoded.weeks[0].categories.size(), 1u);
  EXPECT_EQ(decoded.weeks[0].categories[0].account_range,
            (account_range_t{5000, 5099}));
  ASSERT_EQ(decoded.alerts.size(), 1u);
  EXPECT_EQ(decoded.alerts[0].severity, alert_severity_t::warning);
  EXPECT_EQ(decoded.kpis.min_balance_week, std::optional<uint32_t>{9});
  ASSERT_TRUE(decoded.kpis.runway_weeks.has_value());
  EXPECT_DOUBLE_EQ(*decoded.kpis.runway_weeks, 10.54);
  ASSERT_EQ(decoded.recurring_patterns.size(), 1u);
  EXPECT_EQ(decoded.recurring_patterns[0].counterparty,
            std::optional<std::string>{"Staff"});
  EXPECT_DOUBLE_EQ(decoded.recurring_patterns[0].confidence, 0.92);
  ASSERT_EQ(decoded.category_breakdown.size(), 1u);
  EXPECT_EQ(decoded.category_breakdown[0].color, "#ef4444");

  EXPECT_EQ(encoder.encode(decoded), encoded);
}

TEST(encoding_types, unbounded_runway_survives_encoding) {
  auto encoder = encoder_t{};
  auto result = make_result();
  result.kpis.runway_weeks.reset();
  result.kpis.min_balance_week.reset();
  auto decoded = encoder.decode<forecast_result_t>(
      bytes_view_t{encoder.encode(result)});
  EXPECT_FALSE(decoded.kpis.runway_weeks.has_value());
  EXPECT_FALSE(decoded.kpis.min_balance_week.has_value());
}

TEST(encoding_types, currency_travels_as_integer_cents) {
  auto encoder = encoder_t{};
  auto alert = liquidity_alert_t{.calendar_week = 1,
                                 .severity = alert_severity_t::critical,
                                 .message = "",
                                 .projected_balance = -0.01};
  auto encoded = encoder.encode(alert);
  // version (2) + week (4) + severity (1) + empty string (1) + cents (8)
  ASSERT_EQ(encoded.size(), 16u);
  EXPECT_EQ(encoded[6], 2u);
  for (std::size_t i = 8; i < encoded.size(); ++i) {
    EXPECT_EQ(encoded[i], 0xFFu);
  }
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_result());
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(
      encoder.try_decode<forecast_result_t>(bytes_view_t{encoded}).has_value());
}

TEST(encoding_types, fingerprint_is_stable_and_sensitive) {
  auto result = make_result();
  auto first = liquidity::forecast::forecast_fingerprint(result);
  EXPECT_EQ(first, liquidity::forecast::forecast_fingerprint(make_result()));

  result.weeks[0].closing_balance += 0.01;
  EXPECT_NE(first, liquidity::forecast::forecast_fingerprint(result));
}

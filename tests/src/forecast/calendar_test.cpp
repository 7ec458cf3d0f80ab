#include <gtest/gtest.h>
#include <liquidity/forecast/calendar.hpp>
#include <liquidity/testing/common.hpp>

using liquidity::testing::make_date;
using namespace liquidity::forecast;

TEST(calendar, monday_of_returns_monday_on_or_before_date) {
  EXPECT_EQ(monday_of(make_date(2024, 3, 1)), make_date(2024, 2, 26));
  EXPECT_EQ(monday_of(make_date(2024, 2, 26)), make_date(2024, 2, 26));
  EXPECT_EQ(monday_of(make_date(2024, 3, 3)), make_date(2024, 2, 26));
  EXPECT_EQ(monday_of(make_date(2025, 1, 1)), make_date(2024, 12, 30));
}

TEST(calendar, iso_week_follows_thursday_rule) {
  EXPECT_EQ(iso_week(make_date(2024, 2, 26)), (iso_week_t{2024, 9}));
  EXPECT_EQ(iso_week(make_date(2021, 1, 1)), (iso_week_t{2020, 53}));
  EXPECT_EQ(iso_week(make_date(2024, 12, 30)), (iso_week_t{2025, 1}));
  EXPECT_EQ(iso_week(make_date(2024, 1, 1)), (iso_week_t{2024, 1}));
}

TEST(calendar, iso_weeks_order_by_year_then_week) {
  EXPECT_LT((iso_week_t{2020, 53}), (iso_week_t{2021, 1}));
  EXPECT_LT((iso_week_t{2024, 8}), (iso_week_t{2024, 9}));
}

TEST(calendar, next_day_of_month_moves_forward_only) {
  EXPECT_EQ(next_day_of_month(make_date(2024, 3, 1), 26),
            make_date(2024, 3, 26));
  EXPECT_EQ(next_day_of_month(make_date(2024, 3, 26), 26),
            make_date(2024, 3, 26));
  EXPECT_EQ(next_day_of_month(make_date(2024, 3, 27), 26),
            make_date(2024, 4, 26));
}

TEST(calendar, next_day_of_month_clamps_to_short_months) {
  EXPECT_EQ(next_day_of_month(make_date(2024, 2, 10), 31),
            make_date(2024, 2, 29));
  EXPECT_EQ(next_day_of_month(make_date(2023, 12, 31), 31),
            make_date(2023, 12, 31));
  EXPECT_EQ(day_of_month(make_date(2024, 2, 29)), 29u);
}

#include <gtest/gtest.h>
#include <liquidity/forecast/account_categorizer.hpp>
#include <liquidity/forecast/pattern_detector.hpp>
#include <liquidity/testing/common.hpp>

#include <chrono>
#include <vector>

using namespace liquidity::schema;
using namespace liquidity::forecast;
using liquidity::testing::make_booking;
using liquidity::testing::make_date;

namespace {

const auto kNow = make_date(2024, 3, 1);

date_t days_before(const int days) {
  return kNow - std::chrono::days{days};
}

}  // namespace

TEST(pattern_detector, normalize_description_masks_digits_and_whitespace) {
  EXPECT_EQ(normalize_description("  Miete   03/2024 Lager "), "miete #/# lager");
  EXPECT_EQ(normalize_description("Gehalt 2024"), "gehalt #");
  EXPECT_EQ(normalize_description("\tABC\n"), "abc");
  EXPECT_EQ(normalize_description(""), "");
}

TEST(pattern_detector, empty_history_yields_no_patterns) {
  auto categorizer = account_categorizer{};
  auto detector = pattern_detector{categorizer, default_pattern_options()};
  EXPECT_TRUE(detector.detect({}, kNow).empty());
}

TEST(pattern_detector, single_occurrence_group_never_appears) {
  auto categorizer = account_categorizer{};
  auto options = default_pattern_options();
  ASSERT_EQ(options.min_occurrences, 2u);
  auto detector = pattern_detector{categorizer, options};
  // One recent booking would fall in the monthly band on rate alone.
  auto bookings = std::vector<booking_t>{
      make_booking(days_before(3), 1'200.0, 4210, "Miete Lager", "Vermieter"),
  };
  EXPECT_TRUE(detector.detect(bookings, kNow).empty());
}

TEST(pattern_detector, weekly_cluster_is_classified_weekly) {
  auto categorizer = account_categorizer{};
  auto detector = pattern_detector{categorizer, default_pattern_options()};
  auto bookings = std::vector<booking_t>{};
  for (auto week = 0; week < 5; ++week) {
    bookings.push_back(make_booking(days_before(7 * week), 200.0, 6300,
                                    "Reinigung KW " + std::to_string(9 - week),
                                    "CleanCo"));
  }

  auto patterns = detector.detect(bookings, kNow);
  ASSERT_EQ(patterns.size(), 1u);
  const auto& pattern = patterns[0];
  EXPECT_EQ(pattern.description, "reinigung kw #");
  EXPECT_EQ(pattern.counterparty, std::optional<std::string>{"CleanCo"});
  EXPECT_EQ(pattern.frequency, recurrence_frequency_t::weekly);
  EXPECT_DOUBLE_EQ(pattern.confidence, 1.0);
  EXPECT_EQ(pattern.occurrences, 5u);
  EXPECT_DOUBLE_EQ(pattern.average_amount, 200.0);
  EXPECT_EQ(pattern.typical_day_of_month, 10u);
  EXPECT_EQ(pattern.direction, cashflow_direction_t::outflow);
  EXPECT_EQ(pattern.category, "Sonstige Aufwendungen");
  EXPECT_EQ(pattern.account_range, (account_range_t{6300, 6399}));
}

TEST(pattern_detector, confidence_scales_with_nominal_rate) {
  auto categorizer = account_categorizer{};
  auto detector = pattern_detector{categorizer, default_pattern_options()};
  auto bookings = std::vector<booking_t>{
      make_booking(days_before(2), 900.0, 4300, "Leasing", "Bank"),
      make_booking(days_before(16), 900.0, 4300, "Leasing", "Bank"),
      make_booking(days_before(44), 900.0, 4300, "Leasing", "Bank"),
  };

  auto patterns = detector.detect(bookings, kNow);
  ASSERT_EQ(patterns.size(), 1u);
  EXPECT_EQ(patterns[0].frequency, recurrence_frequency_t::biweekly);
  EXPECT_DOUBLE_EQ(patterns[0].confidence, 0.92);
  EXPECT_EQ(patterns[0].occurrences, 3u);
  EXPECT_EQ(patterns[0].category, "Versicherungen");
}

TEST(pattern_detector, clusters_without_recent_activity_are_dropped) {
  auto categorizer = account_categorizer{};
  auto detector = pattern_detector{categorizer, default_pattern_options()};
  auto bookings = std::vector<booking_t>{
      make_booking(days_before(95), 3'000.0, 7000, "Umsatzsteuer Q3"),
      make_booking(days_before(185), 3'000.0, 7000, "Umsatzsteuer Q2"),
      make_booking(days_before(3), 50.0, 6800, "Porto"),
  };
  EXPECT_TRUE(detector.detect(bookings, kNow).empty());
}

TEST(pattern_detector, counterparty_separates_clusters) {
  auto categorizer = account_categorizer{};
  auto detector = pattern_detector{categorizer, default_pattern_options()};
  auto bookings = std::vector<booking_t>{
      make_booking(days_before(5), 1'200.0, 8400, "Wartungsvertrag", "Alpha"),
      make_booking(days_before(35), 1'200.0, 8400, "Wartungsvertrag", "Alpha"),
      make_booking(days_before(6), 800.0, 8400, "Wartungsvertrag", "Beta"),
      make_booking(days_before(36), 800.0, 8400, "Wartungsvertrag", "Beta"),
      make_booking(days_before(66), 800.0, 8400, "Wartungsvertrag", "Beta"),
      make_booking(days_before(7), 10.0, 8400, "Wartungsvertrag"),
      make_booking(days_before(37), 10.0, 8400, "Wartungsvertrag"),
  };

  auto patterns = detector.detect(bookings, kNow);
  ASSERT_EQ(patterns.size(), 3u);
  EXPECT_EQ(patterns[0].counterparty, std::optional<std::string>{"Beta"});
  EXPECT_EQ(patterns[0].occurrences, 3u);
  for (const auto& pattern : patterns) {
    EXPECT_EQ(pattern.frequency, recurrence_frequency_t::monthly);
    EXPECT_EQ(pattern.direction, cashflow_direction_t::inflow);
    EXPECT_EQ(pattern.category, "Erlöse");
  }
  EXPECT_EQ(patterns[1].counterparty, std::optional<std::string>{"Alpha"});
  EXPECT_FALSE(patterns[2].counterparty.has_value());
}

TEST(pattern_detector, average_uses_absolute_amounts) {
  auto categorizer = account_categorizer{};
  auto detector = pattern_detector{categorizer, default_pattern_options()};
  auto bookings = std::vector<booking_t>{
      make_booking(days_before(1), -100.0, 3000, "Lieferung"),
      make_booking(days_before(31), -300.0, 3000, "Lieferung"),
  };
  auto patterns = detector.detect(bookings, kNow);
  ASSERT_EQ(patterns.size(), 1u);
  EXPECT_DOUBLE_EQ(patterns[0].average_amount, 200.0);
  EXPECT_EQ(patterns[0].direction, cashflow_direction_t::outflow);
}

TEST(pattern_detector, min_occurrences_is_configurable) {
  auto categorizer = account_categorizer{};
  auto options = default_pattern_options();
  options.min_occurrences = 3;
  auto detector = pattern_detector{categorizer, options};
  auto bookings = std::vector<booking_t>{
      make_booking(days_before(1), 100.0, 3000, "Lieferung"),
      make_booking(days_before(31), 100.0, 3000, "Lieferung"),
  };
  EXPECT_TRUE(detector.detect(bookings, kNow).empty());
}

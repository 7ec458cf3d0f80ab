#include <gtest/gtest.h>
#include <liquidity/forecast/account_categorizer.hpp>
#include <liquidity/testing/common.hpp>

#include <utility>

using namespace liquidity::schema;
using liquidity::forecast::account_categorizer;

TEST(account_categorizer, default_table_maps_account_ranges) {
  auto categorizer = account_categorizer{};
  EXPECT_EQ(categorizer.categorize(8400).name, "Erlöse");
  EXPECT_EQ(categorizer.categorize(8400).direction, cashflow_direction_t::inflow);
  EXPECT_EQ(categorizer.categorize(5000).name, "Personalkosten");
  EXPECT_EQ(categorizer.categorize(3999).name, "Materialkosten");
  EXPECT_EQ(categorizer.categorize(4350).name, "Versicherungen");
  EXPECT_EQ(categorizer.categorize(7100).name, "Steuern");
}

TEST(account_categorizer, first_matching_rule_wins) {
  auto categorizer = account_categorizer{};
  EXPECT_EQ(categorizer.categorize(4210).name, "Raumkosten");

  auto options = liquidity::forecast::default_categorizer_options();
  std::swap(options.rules[3], options.rules[4]);
  auto reordered = account_categorizer{options};
  EXPECT_EQ(reordered.categorize(4210).name, "Energie");
  EXPECT_EQ(reordered.categorize(4260).name, "Raumkosten");
}

TEST(account_categorizer, unmatched_accounts_fall_back_by_boundary) {
  auto categorizer = account_categorizer{};
  auto revenue = categorizer.categorize(1200);
  EXPECT_EQ(revenue.name, "Sonstige Erlöse");
  EXPECT_EQ(revenue.direction, cashflow_direction_t::inflow);
  EXPECT_EQ(revenue.color, "#34d399");

  auto expense = categorizer.categorize(9500);
  EXPECT_EQ(expense.name, "Sonstige Aufwendungen");
  EXPECT_EQ(expense.direction, cashflow_direction_t::outflow);
  EXPECT_EQ(expense.color, "#9ca3af");
}

TEST(account_categorizer, negative_amount_reverses_direction) {
  auto categorizer = account_categorizer{};
  auto date = liquidity::testing::make_date(2024, 3, 1);

  auto sale = categorizer.flow_of(
      liquidity::testing::make_booking(date, 1'000.0, 8400, "Rechnung"));
  EXPECT_EQ(sale.direction, cashflow_direction_t::inflow);
  EXPECT_DOUBLE_EQ(sale.amount, 1'000.0);

  auto credit_note = categorizer.flow_of(
      liquidity::testing::make_booking(date, -200.0, 8400, "Gutschrift"));
  EXPECT_EQ(credit_note.direction, cashflow_direction_t::outflow);
  EXPECT_DOUBLE_EQ(credit_note.amount, 200.0);

  auto refund = categorizer.flow_of(
      liquidity::testing::make_booking(date, -50.0, 3000, "Erstattung"));
  EXPECT_EQ(refund.direction, cashflow_direction_t::inflow);
}

TEST(account_categorizer, color_of_looks_up_by_name) {
  auto categorizer = account_categorizer{};
  EXPECT_EQ(categorizer.color_of("Personalkosten"), "#ef4444");
  EXPECT_EQ(categorizer.color_of("Sonstige Erlöse"), "#34d399");
  EXPECT_EQ(categorizer.color_of("Nicht vorhanden"), "#9ca3af");
}

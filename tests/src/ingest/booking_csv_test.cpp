#include <gtest/gtest.h>
#include <liquidity/ingest/booking_csv.hpp>
#include <liquidity/testing/common.hpp>

#include <filesystem>
#include <sstream>
#include <string>

using liquidity::ingest::read_bookings;
using liquidity::ingest::split_csv_line;
using liquidity::testing::make_date;

TEST(booking_csv, split_handles_quotes_and_escapes) {
  auto fields = split_csv_line(R"(a,"b, c","say ""hi""",)");
  ASSERT_EQ(fields.size(), 4u);
  EXPECT_EQ(fields[0], "a");
  EXPECT_EQ(fields[1], "b, c");
  EXPECT_EQ(fields[2], R"(say "hi")");
  EXPECT_EQ(fields[3], "");
}

TEST(booking_csv, reads_rows_by_header_name) {
  auto input = std::istringstream{
      "text,amount,account,posting_date,vendor\n"
      "\"Miete, Lager\",1200.50,4210,2024-02-01,Vermieter GmbH\n"
      "Rechnung 17,-50,8400,2024-02-02,\n"};
  auto error = std::string{};
  auto batch = read_bookings(input, error);
  ASSERT_TRUE(batch.has_value()) << error;
  ASSERT_EQ(batch->bookings.size(), 2u);
  EXPECT_EQ(batch->rejected_rows, 0u);

  const auto& rent = batch->bookings[0];
  EXPECT_EQ(rent.posting_date, make_date(2024, 2, 1));
  EXPECT_DOUBLE_EQ(rent.amount, 1'200.5);
  EXPECT_EQ(rent.account, 4210u);
  EXPECT_EQ(rent.counterparty, "Vermieter GmbH");
  EXPECT_EQ(rent.text, "Miete, Lager");

  EXPECT_DOUBLE_EQ(batch->bookings[1].amount, -50.0);
  EXPECT_TRUE(batch->bookings[1].counterparty.empty());
}

TEST(booking_csv, accepts_alternative_column_names) {
  auto input = std::istringstream{
      "\xEF\xBB\xBFPosting_Date,Amount,Account,Counterparty,Description\r\n"
      "2024-02-01,10,3000,Supplier,Material\r\n"};
  auto error = std::string{};
  auto batch = read_bookings(input, error);
  ASSERT_TRUE(batch.has_value()) << error;
  ASSERT_EQ(batch->bookings.size(), 1u);
  EXPECT_EQ(batch->bookings[0].counterparty, "Supplier");
  EXPECT_EQ(batch->bookings[0].text, "Material");
}

TEST(booking_csv, bad_rows_are_skipped_and_counted) {
  auto input = std::istringstream{
      "posting_date,amount,account,text\n"
      "2024-02-30,10,3000,bad date\n"
      "2024-02-01,ten,3000,bad amount\n"
      "2024-02-01,10,-3,bad account\n"
      "2024-02-01,10\n"
      "\n"
      "2024-02-01,10,3000,good\n"};
  auto error = std::string{};
  auto batch = read_bookings(input, error);
  ASSERT_TRUE(batch.has_value()) << error;
  ASSERT_EQ(batch->bookings.size(), 1u);
  EXPECT_EQ(batch->bookings[0].text, "good");
  EXPECT_EQ(batch->rejected_rows, 4u);
}

TEST(booking_csv, missing_required_column_is_an_error) {
  auto input = std::istringstream{"posting_date,amount,text\n"};
  auto error = std::string{};
  EXPECT_FALSE(read_bookings(input, error).has_value());
  EXPECT_EQ(error, "missing required column 'account'");
}

TEST(booking_csv, missing_file_is_an_error) {
  auto error = std::string{};
  auto batch = read_bookings(
      std::filesystem::path{liquidity::testing::make_temp_path("no_bookings")},
      error);
  EXPECT_FALSE(batch.has_value());
  EXPECT_NE(error.find("cannot read bookings file"), std::string::npos);
}

#pragma once

#include <liquidity/schema/booking.hpp>
#include <liquidity/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace liquidity::testing {

inline liquidity::schema::date_t make_date(const int year,
                                           const unsigned month,
                                           const unsigned day) {
  return liquidity::schema::date_t{std::chrono::year{year} /
                                   std::chrono::month{month} /
                                   std::chrono::day{day}};
}

inline liquidity::schema::booking_t make_booking(
    const liquidity::schema::date_t date,
    const liquidity::schema::amount_t amount,
    const liquidity::schema::account_number_t account,
    const std::string_view text,
    const std::string_view counterparty = {}) {
  auto booking = liquidity::schema::booking_t{};
  booking.posting_date = date;
  booking.amount = amount;
  booking.account = account;
  booking.text = std::string{text};
  booking.counterparty = std::string{counterparty};
  return booking;
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline std::string write_temp_file(const std::string_view prefix,
                                   const std::string_view contents) {
  auto path = make_temp_path(prefix);
  auto out = std::ofstream{path, std::ios::binary};
  out << contents;
  return path;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace liquidity::testing

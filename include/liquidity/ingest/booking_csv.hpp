#pragma once

#include <liquidity/schema/booking.hpp>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liquidity::ingest {

struct booking_batch_t final {
  std::vector<schema::booking_t> bookings;
  // Data rows dropped for an unparsable date, amount or account.
  std::size_t rejected_rows{};
};

/// Split one CSV record. Fields may be double-quoted; `""` inside a quoted
/// field is a literal quote.
std::vector<std::string> split_csv_line(std::string_view line);

/// Read bookings from CSV text with a header row.
///
/// Columns are located by name: `posting_date`, `amount`, `account`, an
/// optional `vendor` or `counterparty`, and `text` or `description`. Returns
/// an empty optional when a required column is missing.
std::optional<booking_batch_t> read_bookings(std::istream& input,
                                             std::string& error);

std::optional<booking_batch_t> read_bookings(const std::filesystem::path& path,
                                             std::string& error);

}  // namespace liquidity::ingest

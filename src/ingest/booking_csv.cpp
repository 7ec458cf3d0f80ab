#include <liquidity/ingest/booking_csv.hpp>
#include <liquidity/schema/primitives.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <stdexcept>

using namespace liquidity::schema;

namespace liquidity::ingest {

namespace {

constexpr auto kUtf8Bom = std::string_view{"\xEF\xBB\xBF"};

std::string_view trim(std::string_view text) {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::string lowercase(std::string_view text) {
  auto out = std::string{text};
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](const unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return out;
}

struct column_layout_t final {
  std::size_t posting_date{};
  std::size_t amount{};
  std::size_t account{};
  std::optional<std::size_t> counterparty;
  std::size_t text{};
};

std::optional<std::size_t> find_column(
    const std::vector<std::string>& header,
    std::initializer_list<std::string_view> names) {
  for (const auto name : names) {
    auto it = std::find(std::begin(header), std::end(header), name);
    if (it != std::end(header)) {
      return static_cast<std::size_t>(std::distance(std::begin(header), it));
    }
  }
  return std::nullopt;
}

std::optional<column_layout_t> locate_columns(const std::string& line,
                                              std::string& error) {
  auto header = split_csv_line(line);
  for (auto& name : header) {
    name = lowercase(trim(name));
  }

  auto posting_date = find_column(header, {"posting_date"});
  auto amount = find_column(header, {"amount"});
  auto account = find_column(header, {"account"});
  auto text = find_column(header, {"text", "description"});
  auto missing = std::string_view{};
  if (!posting_date) {
    missing = "posting_date";
  } else if (!amount) {
    missing = "amount";
  } else if (!account) {
    missing = "account";
  } else if (!text) {
    missing = "text";
  }
  if (!missing.empty()) {
    error = fmt::format("missing required column '{}'", missing);
    return std::nullopt;
  }
  return column_layout_t{.posting_date = *posting_date,
                         .amount = *amount,
                         .account = *account,
                         .counterparty =
                             find_column(header, {"vendor", "counterparty"}),
                         .text = *text};
}

std::optional<amount_t> parse_amount(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    auto consumed = std::size_t{};
    auto value = std::stod(std::string{text}, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<account_number_t> parse_account(const std::string_view text) {
  auto value = account_number_t{};
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::vector<std::string> split_csv_line(const std::string_view line) {
  auto fields = std::vector<std::string>{};
  auto current = std::string{};
  auto quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const auto c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(current));
      current.clear();
    } else if (c != '\r') {
      current.push_back(c);
    }
  }
  fields.push_back(std::move(current));
  return fields;
}

std::optional<booking_batch_t> read_bookings(std::istream& input,
                                             std::string& error) {
  auto line = std::string{};
  if (!std::getline(input, line)) {
    error = "missing header row";
    return std::nullopt;
  }
  if (line.starts_with(kUtf8Bom)) {
    line.erase(0, kUtf8Bom.size());
  }
  auto layout = locate_columns(line, error);
  if (!layout) {
    return std::nullopt;
  }
  auto required = std::max({layout->posting_date, layout->amount,
                            layout->account, layout->text});

  auto batch = booking_batch_t{};
  auto line_number = std::size_t{1};
  while (std::getline(input, line)) {
    ++line_number;
    if (trim(line).empty()) {
      continue;
    }
    auto fields = split_csv_line(line);
    if (fields.size() <= required) {
      spdlog::warn("line {}: expected at least {} fields, got {}", line_number,
                   required + 1, fields.size());
      ++batch.rejected_rows;
      continue;
    }
    auto date = try_parse_date(trim(fields[layout->posting_date]));
    auto amount = parse_amount(trim(fields[layout->amount]));
    auto account = parse_account(trim(fields[layout->account]));
    if (!date || !amount || !account) {
      spdlog::warn("line {}: skipping row with invalid {}", line_number,
                   !date ? "posting_date" : (!amount ? "amount" : "account"));
      ++batch.rejected_rows;
      continue;
    }

    auto booking = booking_t{};
    booking.posting_date = *date;
    booking.amount = *amount;
    booking.account = *account;
    if (layout->counterparty && *layout->counterparty < fields.size()) {
      booking.counterparty = std::string{trim(fields[*layout->counterparty])};
    }
    booking.text = std::string{trim(fields[layout->text])};
    batch.bookings.push_back(std::move(booking));
  }

  spdlog::info("read {} bookings, rejected {} rows", batch.bookings.size(),
               batch.rejected_rows);
  return batch;
}

std::optional<booking_batch_t> read_bookings(const std::filesystem::path& path,
                                             std::string& error) {
  auto input = std::ifstream{path};
  if (!input) {
    error = fmt::format("cannot read bookings file {}", path.string());
    return std::nullopt;
  }
  auto batch = read_bookings(input, error);
  if (!batch) {
    error = fmt::format("{}: {}", path.string(), error);
  }
  return batch;
}

}  // namespace liquidity::ingest

#include <liquidity/schema/primitives.hpp>

#include <cmath>
#include <limits>
#include <string_view>

namespace liquidity::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::string to_hex_internal(const bytes_view_t bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<int> parse_digits(const std::string_view text) {
  auto value = 0;
  for (const auto c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = (value * 10) + (c - '0');
  }
  return value;
}

double round_two_decimals(const double value) {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::round(value * 100.0) / 100.0;
}

}  // namespace

amount_t round_currency(const amount_t value) {
  return round_two_decimals(value);
}

double round_ratio(const double value) {
  return round_two_decimals(value);
}

minor_units_t to_minor_units(const amount_t value) {
  if (!std::isfinite(value)) {
    return 0;
  }
  // 2^63 is exact in a double; llround is only defined below it.
  constexpr auto kLimit = 9'223'372'036'854'775'808.0;
  auto scaled = value * 100.0;
  if (scaled >= kLimit) {
    return std::numeric_limits<minor_units_t>::max();
  }
  if (scaled <= -kLimit) {
    return std::numeric_limits<minor_units_t>::min();
  }
  return static_cast<minor_units_t>(std::llround(scaled));
}

amount_t from_minor_units(const minor_units_t value) {
  return static_cast<amount_t>(value) / 100.0;
}

basis_points_t to_basis_points(const double value) {
  if (!std::isfinite(value)) {
    return 0;
  }
  return static_cast<basis_points_t>(std::llround(value * 10'000.0));
}

double from_basis_points(const basis_points_t value) {
  return static_cast<double>(value) / 10'000.0;
}

int32_t to_epoch_days(const date_t date) {
  return static_cast<int32_t>(date.time_since_epoch().count());
}

date_t from_epoch_days(const int32_t days) {
  return date_t{std::chrono::days{days}};
}

std::optional<date_t> try_parse_date(const std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  auto year = parse_digits(text.substr(0, 4));
  auto month = parse_digits(text.substr(5, 2));
  auto day = parse_digits(text.substr(8, 2));
  if (!year || !month || !day) {
    return std::nullopt;
  }
  auto ymd = std::chrono::year_month_day{
      std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
      std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return date_t{ymd};
}

std::string format_date(const date_t date) {
  auto ymd = std::chrono::year_month_day{date};
  auto out = std::string(10, '0');
  auto year = static_cast<int>(ymd.year());
  auto month = static_cast<unsigned>(ymd.month());
  auto day = static_cast<unsigned>(ymd.day());
  for (auto i = 3; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = static_cast<char>('0' + (year % 10));
    year /= 10;
  }
  out[4] = '-';
  out[5] = static_cast<char>('0' + (month / 10));
  out[6] = static_cast<char>('0' + (month % 10));
  out[7] = '-';
  out[8] = static_cast<char>('0' + (day / 10));
  out[9] = static_cast<char>('0' + (day % 10));
  return out;
}

std::string format_currency(const amount_t value) {
  auto cents = to_minor_units(value);
  auto negative = cents < 0;
  auto magnitude = static_cast<uint64_t>(cents);
  if (negative) {
    magnitude = uint64_t{0} - magnitude;
  }
  auto whole = std::to_string(magnitude / 100);
  auto fraction = magnitude % 100;

  auto grouped = std::string{};
  grouped.reserve(whole.size() + (whole.size() / 3));
  for (std::size_t i = 0; i < whole.size(); ++i) {
    if (i != 0 && ((whole.size() - i) % 3) == 0) {
      grouped.push_back(',');
    }
    grouped.push_back(whole[i]);
  }

  auto out = std::string{"EUR "};
  if (negative) {
    out.push_back('-');
  }
  out += grouped;
  out.push_back('.');
  out.push_back(static_cast<char>('0' + (fraction / 10)));
  out.push_back(static_cast<char>('0' + (fraction % 10)));
  return out;
}

std::string to_hex(const bytes_t& bytes) {
  return to_hex_internal(bytes_view_t{bytes});
}

std::string to_hex(const hash32_t& hash) {
  return to_hex_internal(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

}  // namespace liquidity::schema

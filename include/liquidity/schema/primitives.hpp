#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace liquidity::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Currency in major units (EUR). Single currency only.
using amount_t = double;
// Integer cents, used on the wire.
using minor_units_t = int64_t;
// Confidences and percentages scaled by 10'000, used on the wire.
using basis_points_t = int64_t;
using account_number_t = uint32_t;
using date_t = std::chrono::sys_days;
using account_range_t = std::pair<account_number_t, account_number_t>;

// Largest magnitude whose cent value fits in minor_units_t.
inline constexpr auto kMaxAmount =
    static_cast<amount_t>(std::numeric_limits<minor_units_t>::max()) / 100.0;

/// Round to cents, half away from zero. Non-finite input yields 0.
amount_t round_currency(amount_t value);
/// Round a ratio or percentage to two decimals. Non-finite input yields 0.
double round_ratio(double value);

/// Saturates at the minor_units_t limits; non-finite input yields 0.
minor_units_t to_minor_units(amount_t value);
amount_t from_minor_units(minor_units_t value);
basis_points_t to_basis_points(double value);
double from_basis_points(basis_points_t value);

int32_t to_epoch_days(date_t date);
date_t from_epoch_days(int32_t days);

/// Parse an ISO `YYYY-MM-DD` date. Rejects impossible calendar dates.
std::optional<date_t> try_parse_date(std::string_view text);
std::string format_date(date_t date);

/// `EUR 12,345.67`
std::string format_currency(amount_t value);

std::string to_hex(const bytes_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace liquidity::schema

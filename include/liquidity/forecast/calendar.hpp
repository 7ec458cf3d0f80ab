#pragma once

#include <liquidity/schema/primitives.hpp>
#include <compare>
#include <cstdint>

namespace liquidity::forecast {

/// ISO-8601 week: weeks start on Monday, week 1 contains the year's first
/// Thursday.
struct iso_week_t final {
  int32_t year{};
  uint32_t week{};

  auto operator<=>(const iso_week_t&) const = default;
};

/// Monday on or before `date`.
schema::date_t monday_of(schema::date_t date);
iso_week_t iso_week(schema::date_t date);
uint32_t day_of_month(schema::date_t date);

/// First date on or after `from` falling on `day` of its month. Months
/// shorter than `day` use their last day.
schema::date_t next_day_of_month(schema::date_t from, uint32_t day);

}  // namespace liquidity::forecast

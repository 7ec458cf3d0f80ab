#include <liquidity/forecast/calendar.hpp>

#include <algorithm>

namespace liquidity::forecast {

namespace {

schema::date_t clamped_day_in_month(const std::chrono::year_month ym,
                                    const uint32_t day) {
  auto last = static_cast<unsigned>(
      std::chrono::year_month_day_last{ym.year(),
                                       std::chrono::month_day_last{ym.month()}}
          .day());
  auto clamped = std::clamp(day, 1u, last);
  return schema::date_t{ym / std::chrono::day{clamped}};
}

}  // namespace

schema::date_t monday_of(const schema::date_t date) {
  auto weekday = std::chrono::weekday{date};
  return date - (weekday - std::chrono::Monday);
}

iso_week_t iso_week(const schema::date_t date) {
  auto thursday = monday_of(date) + std::chrono::days{3};
  auto year = std::chrono::year_month_day{thursday}.year();
  auto first_day = schema::date_t{year / std::chrono::January / 1};
  auto week = static_cast<uint32_t>((thursday - first_day).count() / 7 + 1);
  return iso_week_t{.year = static_cast<int32_t>(year), .week = week};
}

uint32_t day_of_month(const schema::date_t date) {
  return static_cast<unsigned>(std::chrono::year_month_day{date}.day());
}

schema::date_t next_day_of_month(const schema::date_t from,
                                 const uint32_t day) {
  auto ymd = std::chrono::year_month_day{from};
  auto month = std::chrono::year_month{ymd.year(), ymd.month()};
  auto candidate = clamped_day_in_month(month, day);
  if (candidate >= from) {
    return candidate;
  }
  return clamped_day_in_month(month + std::chrono::months{1}, day);
}

}  // namespace liquidity::forecast

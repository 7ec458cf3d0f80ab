#pragma once

#include <liquidity/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: forecast config.
// Liquidity workflow: per-run inputs besides the bookings. `now` has no
// default and is never read from a clock.
namespace liquidity::schema {

inline constexpr auto kDefaultThreshold = amount_t{50'000.0};
inline constexpr auto kDefaultHorizonWeeks = int32_t{13};

template <uint16_t Version>
struct forecast_config;

template <>
struct forecast_config<1> final {
  uint16_t version{1};
  amount_t start_balance{};
  amount_t threshold{kDefaultThreshold};
  int32_t weeks{kDefaultHorizonWeeks};
  std::optional<date_t> now;
};

using forecast_config_t = forecast_config<1>;

}  // namespace liquidity::schema

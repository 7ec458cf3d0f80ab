#pragma once

#include <liquidity/schema/primitives.hpp>
#include <optional>

// Schema type: forecast kpis.
namespace liquidity::schema {

template <uint16_t Version>
struct forecast_kpis;

template <>
struct forecast_kpis<1> final {
  uint16_t version{1};
  amount_t current_balance{};
  amount_t min_balance{};
  // Empty when no week closes below the starting balance.
  std::optional<uint32_t> min_balance_week;
  amount_t burn_rate{};
  // Weeks until the balance reaches zero. Empty means no depletion is
  // projected; callers must handle it before formatting.
  std::optional<double> runway_weeks;
  amount_t avg_weekly_inflow{};
  amount_t avg_weekly_outflow{};
  amount_t total_projected_inflow{};
  amount_t total_projected_outflow{};
};

using forecast_kpis_t = forecast_kpis<1>;

}  // namespace liquidity::schema

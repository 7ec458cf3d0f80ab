#pragma once

#include <liquidity/forecast/account_categorizer.hpp>
#include <liquidity/forecast/options.hpp>
#include <liquidity/schema/booking.hpp>
#include <liquidity/schema/primitives.hpp>
#include <vector>

namespace liquidity::forecast {

struct weekly_baseline_t final {
  schema::amount_t inflows{};
  schema::amount_t outflows{};
};

/// Population standard deviation of historical net cashflow per ISO week.
///
/// Returns `options.fallback_std_dev` when the history covers no week or the
/// result is not finite.
schema::amount_t historical_std_dev(
    const std::vector<schema::booking_t>& bookings,
    const account_categorizer& categorizer,
    const variance_options_t& options);

/// Average weekly inflow and outflow over the trailing window ending at
/// `now`, rounded to cents.
weekly_baseline_t trailing_weekly_baseline(
    const std::vector<schema::booking_t>& bookings,
    schema::date_t now,
    const account_categorizer& categorizer,
    const baseline_options_t& options);

}  // namespace liquidity::forecast

#include <liquidity/forecast/calendar.hpp>
#include <liquidity/forecast/variance_estimator.hpp>

#include <cmath>
#include <map>

using namespace liquidity::schema;

namespace liquidity::forecast {

amount_t historical_std_dev(const std::vector<booking_t>& bookings,
                            const account_categorizer& categorizer,
                            const variance_options_t& options) {
  auto net_by_week = std::map<iso_week_t, amount_t>{};
  for (const auto& booking : bookings) {
    auto flow = categorizer.flow_of(booking);
    auto& net = net_by_week[iso_week(booking.posting_date)];
    net += flow.direction == cashflow_direction_t::inflow ? flow.amount
                                                          : -flow.amount;
  }
  if (net_by_week.empty()) {
    return options.fallback_std_dev;
  }

  auto count = static_cast<double>(net_by_week.size());
  auto mean = 0.0;
  for (const auto& [week, net] : net_by_week) {
    mean += net;
  }
  mean /= count;

  auto variance = 0.0;
  for (const auto& [week, net] : net_by_week) {
    variance += (net - mean) * (net - mean);
  }
  variance /= count;

  auto std_dev = std::sqrt(variance);
  return std::isfinite(std_dev) ? std_dev : options.fallback_std_dev;
}

weekly_baseline_t trailing_weekly_baseline(
    const std::vector<booking_t>& bookings,
    const date_t now,
    const account_categorizer& categorizer,
    const baseline_options_t& options) {
  auto window_start = now - std::chrono::days{options.window_days};
  auto inflows = amount_t{};
  auto outflows = amount_t{};
  for (const auto& booking : bookings) {
    if (booking.posting_date < window_start || booking.posting_date > now) {
      continue;
    }
    auto flow = categorizer.flow_of(booking);
    if (flow.direction == cashflow_direction_t::inflow) {
      inflows += flow.amount;
    } else {
      outflows += flow.amount;
    }
  }
  if (options.weeks_per_window <= 0.0) {
    return weekly_baseline_t{};
  }
  return weekly_baseline_t{
      .inflows = round_currency(inflows / options.weeks_per_window),
      .outflows = round_currency(outflows / options.weeks_per_window)};
}

}  // namespace liquidity::forecast

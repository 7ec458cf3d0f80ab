#include <liquidity/forecast/alert_generator.hpp>

#include <cmath>
#include <spdlog/fmt/fmt.h>

using namespace liquidity::schema;

namespace liquidity::forecast {

std::vector<liquidity_alert_t> generate_alerts(
    const std::vector<liquidity_week_t>& weeks,
    const amount_t threshold,
    const alert_options_t& options) {
  auto alerts = std::vector<liquidity_alert_t>{};
  for (const auto& week : weeks) {
    if (week.closing_balance > 0 && week.closing_balance < threshold) {
      alerts.push_back(liquidity_alert_t{
          .calendar_week = week.calendar_week,
          .severity = alert_severity_t::warning,
          .message = fmt::format("CW {}: balance below threshold, {} expected",
                                 week.calendar_week,
                                 format_currency(week.closing_balance)),
          .projected_balance = week.closing_balance});
    } else if (week.closing_balance <= 0) {
      alerts.push_back(liquidity_alert_t{
          .calendar_week = week.calendar_week,
          .severity = alert_severity_t::critical,
          .message = fmt::format("CW {}: critical shortfall, {} expected",
                                 week.calendar_week,
                                 format_currency(week.closing_balance)),
          .projected_balance = week.closing_balance});
    }

    if (week.index > 0 && week.net_cashflow < options.large_drop) {
      alerts.push_back(liquidity_alert_t{
          .calendar_week = week.calendar_week,
          .severity = alert_severity_t::info,
          .message = fmt::format("CW {}: large cashflow drop, {} expected",
                                 week.calendar_week,
                                 format_currency(std::abs(week.net_cashflow))),
          .projected_balance = week.closing_balance});
    }
  }
  return alerts;
}

}  // namespace liquidity::forecast

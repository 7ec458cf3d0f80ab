#pragma once

#include <liquidity/forecast/options.hpp>
#include <liquidity/schema/liquidity_alert.hpp>
#include <liquidity/schema/liquidity_week.hpp>
#include <liquidity/schema/primitives.hpp>
#include <vector>

namespace liquidity::forecast {

/// Evaluate every week on its own against the balance threshold and the
/// large-drop rule. A week may raise more than one alert; nothing is merged.
std::vector<schema::liquidity_alert_t> generate_alerts(
    const std::vector<schema::liquidity_week_t>& weeks,
    schema::amount_t threshold,
    const alert_options_t& options);

}  // namespace liquidity::forecast

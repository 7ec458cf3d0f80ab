#pragma once

#include <liquidity/forecast/options.hpp>
#include <liquidity/schema/forecast_result.hpp>
#include <string>
#include <vector>

namespace liquidity::forecast {

/// Derive the fixed, ordered list of observations for a projected result.
///
/// Reads weeks, KPIs, patterns and the category breakdown of `result`; its
/// `insights` member is ignored. Observations, in order: balance after the
/// next payroll run, runway or stability, primary cost driver, first-half
/// versus second-half trend, outflow-to-inflow ratio. At most
/// `options.insights.max_count` entries are returned.
std::vector<std::string> narrate_insights(
    const schema::forecast_result_t& result,
    const forecast_options_t& options);

}  // namespace liquidity::forecast

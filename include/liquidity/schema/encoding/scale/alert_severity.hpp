#pragma once

#include <liquidity/schema/alert_severity.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(liquidity::schema,
                             alert_severity_t,
                             liquidity::schema::alert_severity_t::info,
                             liquidity::schema::alert_severity_t::warning,
                             liquidity::schema::alert_severity_t::critical)

#pragma once

#include <liquidity/schema/cashflow_direction.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(liquidity::schema,
                             cashflow_direction_t,
                             liquidity::schema::cashflow_direction_t::inflow,
                             liquidity::schema::cashflow_direction_t::outflow)

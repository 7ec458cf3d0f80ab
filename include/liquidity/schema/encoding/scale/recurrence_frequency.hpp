#pragma once

#include <liquidity/schema/recurrence_frequency.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    liquidity::schema,
    recurrence_frequency_t,
    liquidity::schema::recurrence_frequency_t::weekly,
    liquidity::schema::recurrence_frequency_t::biweekly,
    liquidity::schema::recurrence_frequency_t::monthly,
    liquidity::schema::recurrence_frequency_t::quarterly)

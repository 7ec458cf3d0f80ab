#pragma once

#include <liquidity/schema/forecast_kpis.hpp>
#include <scale/scale.hpp>

namespace liquidity::schema {

void encode(const forecast_kpis<1>& o, ::scale::Encoder& encoder);
void decode(forecast_kpis<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

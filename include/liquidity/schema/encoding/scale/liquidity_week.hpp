#pragma once

#include <liquidity/schema/liquidity_week.hpp>
#include <scale/scale.hpp>

namespace liquidity::schema {

void encode(const liquidity_week<1>& o, ::scale::Encoder& encoder);
void decode(liquidity_week<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

#pragma once

#include <liquidity/schema/recurring_pattern.hpp>
#include <scale/scale.hpp>

namespace liquidity::schema {

void encode(const recurring_pattern<1>& o, ::scale::Encoder& encoder);
void decode(recurring_pattern<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

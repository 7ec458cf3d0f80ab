#pragma once

#include <liquidity/schema/liquidity_alert.hpp>
#include <scale/scale.hpp>

namespace liquidity::schema {

void encode(const liquidity_alert<1>& o, ::scale::Encoder& encoder);
void decode(liquidity_alert<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

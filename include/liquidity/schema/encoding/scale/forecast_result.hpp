#pragma once

#include <liquidity/schema/forecast_result.hpp>
#include <scale/scale.hpp>

// Declared in the schema namespace so argument-dependent lookup finds them
// from the codec's container and optional overloads.
namespace liquidity::schema {

void encode(const forecast_result<1>& o, ::scale::Encoder& encoder);
void decode(forecast_result<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

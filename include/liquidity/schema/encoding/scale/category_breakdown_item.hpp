#pragma once

#include <liquidity/schema/category_breakdown_item.hpp>
#include <scale/scale.hpp>

namespace liquidity::schema {

void encode(const category_breakdown_item<1>& o, ::scale::Encoder& encoder);
void decode(category_breakdown_item<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

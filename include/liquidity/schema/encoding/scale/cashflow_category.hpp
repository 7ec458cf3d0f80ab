#pragma once

#include <liquidity/schema/cashflow_category.hpp>
#include <scale/scale.hpp>

namespace liquidity::schema {

void encode(const cashflow_category<1>& o, ::scale::Encoder& encoder);
void decode(cashflow_category<1>& o, ::scale::Decoder& decoder);

}  // namespace liquidity::schema

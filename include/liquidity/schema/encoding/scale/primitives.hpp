#pragma once
#include <liquidity/schema/primitives.hpp>
#include <scale/scale.hpp>

// Wire representation of the floating point schema fields: currency as
// integer cents, ratios as basis points, dates as days since 1970-01-01.
namespace liquidity::schema::encoding::scale {

void encode_amount(amount_t value, ::scale::Encoder& encoder);
amount_t decode_amount(::scale::Decoder& decoder);

void encode_ratio(double value, ::scale::Encoder& encoder);
double decode_ratio(::scale::Decoder& decoder);

void encode_date(date_t value, ::scale::Encoder& encoder);
date_t decode_date(::scale::Decoder& decoder);

void encode_range(const account_range_t& value, ::scale::Encoder& encoder);
account_range_t decode_range(::scale::Decoder& decoder);

}  // namespace liquidity::schema::encoding::scale

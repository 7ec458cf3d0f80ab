#include <liquidity/schema/encoding/scale/cashflow_direction.hpp>
#include <liquidity/schema/encoding/scale/category_breakdown_item.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const category_breakdown_item<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode_amount(o.total_amount, encoder);
  encode(o.direction, encoder);
  encode_amount(o.weekly_average, encoder);
  encode(o.color, encoder);
  encode_ratio(o.percentage, encoder);
}

void decode(category_breakdown_item<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  o.total_amount = decode_amount(decoder);
  decode(o.direction, decoder);
  o.weekly_average = decode_amount(decoder);
  decode(o.color, decoder);
  o.percentage = decode_ratio(decoder);
}

}  // namespace liquidity::schema

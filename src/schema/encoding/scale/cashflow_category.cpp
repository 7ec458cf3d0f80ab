#include <liquidity/schema/encoding/scale/cashflow_category.hpp>
#include <liquidity/schema/encoding/scale/cashflow_direction.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const cashflow_category<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode_amount(o.amount, encoder);
  encode(o.direction, encoder);
  encode(o.recurring, encoder);
  encode_ratio(o.confidence, encoder);
  encode_range(o.account_range, encoder);
}

void decode(cashflow_category<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  o.amount = decode_amount(decoder);
  decode(o.direction, decoder);
  decode(o.recurring, decoder);
  o.confidence = decode_ratio(decoder);
  o.account_range = decode_range(decoder);
}

}  // namespace liquidity::schema

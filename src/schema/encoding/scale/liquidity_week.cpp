#include <liquidity/schema/encoding/scale/cashflow_category.hpp>
#include <liquidity/schema/encoding/scale/liquidity_week.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const liquidity_week<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.index, encoder);
  encode(o.week_number, encoder);
  encode(o.calendar_week, encoder);
  encode_date(o.start_date, encoder);
  encode_date(o.end_date, encoder);
  encode_amount(o.opening_balance, encoder);
  encode_amount(o.inflows, encoder);
  encode_amount(o.outflows, encoder);
  encode_amount(o.net_cashflow, encoder);
  encode_amount(o.closing_balance, encoder);
  encode_ratio(o.confidence, encoder);
  encode_amount(o.lower_bound, encoder);
  encode_amount(o.upper_bound, encoder);
  encode(o.categories, encoder);
}

void decode(liquidity_week<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.index, decoder);
  decode(o.week_number, decoder);
  decode(o.calendar_week, decoder);
  o.start_date = decode_date(decoder);
  o.end_date = decode_date(decoder);
  o.opening_balance = decode_amount(decoder);
  o.inflows = decode_amount(decoder);
  o.outflows = decode_amount(decoder);
  o.net_cashflow = decode_amount(decoder);
  o.closing_balance = decode_amount(decoder);
  o.confidence = decode_ratio(decoder);
  o.lower_bound = decode_amount(decoder);
  o.upper_bound = decode_amount(decoder);
  decode(o.categories, decoder);
}

}  // namespace liquidity::schema

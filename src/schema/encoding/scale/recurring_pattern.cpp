#include <liquidity/schema/encoding/scale/cashflow_direction.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>
#include <liquidity/schema/encoding/scale/recurrence_frequency.hpp>
#include <liquidity/schema/encoding/scale/recurring_pattern.hpp>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const recurring_pattern<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.description, encoder);
  encode(o.counterparty, encoder);
  encode_amount(o.average_amount, encoder);
  encode(o.frequency, encoder);
  encode(o.typical_day_of_month, encoder);
  encode_ratio(o.confidence, encoder);
  encode(o.occurrences, encoder);
  encode(o.direction, encoder);
  encode(o.category, encoder);
  encode_range(o.account_range, encoder);
}

void decode(recurring_pattern<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.description, decoder);
  decode(o.counterparty, decoder);
  o.average_amount = decode_amount(decoder);
  decode(o.frequency, decoder);
  decode(o.typical_day_of_month, decoder);
  o.confidence = decode_ratio(decoder);
  decode(o.occurrences, decoder);
  decode(o.direction, decoder);
  decode(o.category, decoder);
  o.account_range = decode_range(decoder);
}

}  // namespace liquidity::schema

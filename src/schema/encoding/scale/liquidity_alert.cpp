#include <liquidity/schema/encoding/scale/alert_severity.hpp>
#include <liquidity/schema/encoding/scale/liquidity_alert.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const liquidity_alert<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.calendar_week, encoder);
  encode(o.severity, encoder);
  encode(o.message, encoder);
  encode_amount(o.projected_balance, encoder);
}

void decode(liquidity_alert<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.calendar_week, decoder);
  decode(o.severity, decoder);
  decode(o.message, decoder);
  o.projected_balance = decode_amount(decoder);
}

}  // namespace liquidity::schema

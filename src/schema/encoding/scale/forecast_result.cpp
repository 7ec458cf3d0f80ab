#include <liquidity/schema/encoding/scale/category_breakdown_item.hpp>
#include <liquidity/schema/encoding/scale/forecast_kpis.hpp>
#include <liquidity/schema/encoding/scale/forecast_result.hpp>
#include <liquidity/schema/encoding/scale/liquidity_alert.hpp>
#include <liquidity/schema/encoding/scale/liquidity_week.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>
#include <liquidity/schema/encoding/scale/recurring_pattern.hpp>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const forecast_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_date(o.reference_date, encoder);
  encode_amount(o.start_balance, encoder);
  encode_amount(o.threshold, encoder);
  encode(o.horizon_weeks, encoder);
  encode(o.weeks, encoder);
  encode(o.alerts, encoder);
  encode(o.kpis, encoder);
  encode(o.insights, encoder);
  encode(o.recurring_patterns, encoder);
  encode(o.category_breakdown, encoder);
}

void decode(forecast_result<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  o.reference_date = decode_date(decoder);
  o.start_balance = decode_amount(decoder);
  o.threshold = decode_amount(decoder);
  decode(o.horizon_weeks, decoder);
  decode(o.weeks, decoder);
  decode(o.alerts, decoder);
  decode(o.kpis, decoder);
  decode(o.insights, decoder);
  decode(o.recurring_patterns, decoder);
  decode(o.category_breakdown, decoder);
}

}  // namespace liquidity::schema

#include <liquidity/schema/encoding/scale/forecast_kpis.hpp>
#include <liquidity/schema/encoding/scale/primitives.hpp>

#include <optional>

using namespace liquidity::schema::encoding::scale;

namespace liquidity::schema {

void encode(const forecast_kpis<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.current_balance, encoder);
  encode_amount(o.min_balance, encoder);
  encode(o.min_balance_week, encoder);
  encode_amount(o.burn_rate, encoder);
  auto runway = std::optional<basis_points_t>{};
  if (o.runway_weeks.has_value()) {
    runway = to_basis_points(*o.runway_weeks);
  }
  encode(runway, encoder);
  encode_amount(o.avg_weekly_inflow, encoder);
  encode_amount(o.avg_weekly_outflow, encoder);
  encode_amount(o.total_projected_inflow, encoder);
  encode_amount(o.total_projected_outflow, encoder);
}

void decode(forecast_kpis<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  o.current_balance = decode_amount(decoder);
  o.min_balance = decode_amount(decoder);
  decode(o.min_balance_week, decoder);
  o.burn_rate = decode_amount(decoder);
  auto runway = std::optional<basis_points_t>{};
  decode(runway, decoder);
  o.runway_weeks.reset();
  if (runway.has_value()) {
    o.runway_weeks = from_basis_points(*runway);
  }
  o.avg_weekly_inflow = decode_amount(decoder);
  o.avg_weekly_outflow = decode_amount(decoder);
  o.total_projected_inflow = decode_amount(decoder);
  o.total_projected_outflow = decode_amount(decoder);
}

}  // namespace liquidity::schema

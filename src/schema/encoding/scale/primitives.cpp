#include <liquidity/schema/encoding/scale/primitives.hpp>

namespace liquidity::schema::encoding::scale {

void encode_amount(const amount_t value, ::scale::Encoder& encoder) {
  encode(to_minor_units(value), encoder);
}

amount_t decode_amount(::scale::Decoder& decoder) {
  auto cents = minor_units_t{};
  decode(cents, decoder);
  return from_minor_units(cents);
}

void encode_ratio(const double value, ::scale::Encoder& encoder) {
  encode(to_basis_points(value), encoder);
}

double decode_ratio(::scale::Decoder& decoder) {
  auto points = basis_points_t{};
  decode(points, decoder);
  return from_basis_points(points);
}

void encode_date(const date_t value, ::scale::Encoder& encoder) {
  encode(to_epoch_days(value), encoder);
}

date_t decode_date(::scale::Decoder& decoder) {
  auto days = int32_t{};
  decode(days, decoder);
  return from_epoch_days(days);
}

void encode_range(const account_range_t& value, ::scale::Encoder& encoder) {
  encode(value.first, encoder);
  encode(value.second, encoder);
}

account_range_t decode_range(::scale::Decoder& decoder) {
  auto range = account_range_t{};
  decode(range.first, decoder);
  decode(range.second, decoder);
  return range;
}

}  // namespace liquidity::schema::encoding::scale

#pragma once
#include <liquidity/common/critical.hpp>
#include <liquidity/schema/encoding/encoder.hpp>
#include <liquidity/schema/encoding/scale/alert_severity.hpp>
#include <liquidity/schema/encoding/scale/cashflow_category.hpp>
#include <liquidity/schema/encoding/scale/cashflow_direction.hpp>
#include <liquidity/schema/encoding/scale/category_breakdown_item.hpp>
#include <liquidity/schema/encoding/scale/forecast_kpis.hpp>
#include <liquidity/schema/encoding/scale/forecast_result.hpp>
#include <liquidity/schema/encoding/scale/liquidity_alert.hpp>
#include <liquidity/schema/encoding/scale/liquidity_week.hpp>
#include <liquidity/schema/encoding/scale/recurrence_frequency.hpp>
#include <liquidity/schema/encoding/scale/recurring_pattern.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace liquidity::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  liquidity::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, liquidity::schema::bytes_t& out);

  template <typename T>
  T decode(const liquidity::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const liquidity::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
liquidity::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    liquidity::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        liquidity::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const liquidity::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    liquidity::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const liquidity::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace liquidity::schema::encoding

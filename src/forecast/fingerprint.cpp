#include <liquidity/blake3/hash.hpp>
#include <liquidity/forecast/fingerprint.hpp>
#include <liquidity/schema/encoding/scale/encoder.hpp>

namespace liquidity::forecast {

schema::bytes_t encode_result(const schema::forecast_result_t& result) {
  auto encoder = schema::encoding::scale_encoder_t{};
  return encoder.encode(result);
}

schema::hash32_t forecast_fingerprint(const schema::forecast_result_t& result) {
  auto encoded = encode_result(result);
  return blake3::hash(schema::bytes_view_t{encoded});
}

}  // namespace liquidity::forecast

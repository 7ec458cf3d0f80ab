#pragma once

#include <liquidity/schema/forecast_result.hpp>
#include <liquidity/schema/primitives.hpp>

namespace liquidity::forecast {

/// SCALE encoding of a forecast result.
schema::bytes_t encode_result(const schema::forecast_result_t& result);

/// BLAKE3 digest of the SCALE encoding. Two runs over the same inputs yield
/// the same fingerprint.
schema::hash32_t forecast_fingerprint(const schema::forecast_result_t& result);

}  // namespace liquidity::forecast

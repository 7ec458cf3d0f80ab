#pragma once
#include <liquidity/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace liquidity::blake3 {

liquidity::schema::hash32_t hash(const std::string_view& str);
liquidity::schema::hash32_t hash(const liquidity::schema::bytes_view_t& bytes);

}  // namespace liquidity::blake3

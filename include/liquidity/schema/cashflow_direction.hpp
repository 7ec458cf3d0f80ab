#pragma once

#include <liquidity/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema type: cashflow direction.
// Liquidity workflow: whether money enters or leaves the bank account.
namespace liquidity::schema {

enum class cashflow_direction_t : uint8_t {
  inflow = 0,
  outflow = 1,
};

template <>
struct enum_names<cashflow_direction_t> final {
  static constexpr auto kNames = std::array{
      enum_name_t<cashflow_direction_t>{"inflow", cashflow_direction_t::inflow},
      enum_name_t<cashflow_direction_t>{"outflow",
          cashflow_direction_t::outflow},
  };
};

}  // namespace liquidity::schema

#pragma once

#include <liquidity/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema type: recurrence frequency.
// Liquidity workflow: cadence class assigned to a detected recurring payment.
namespace liquidity::schema {

enum class recurrence_frequency_t : uint8_t {
  weekly = 0,
  biweekly = 1,
  monthly = 2,
  quarterly = 3,
};

template <>
struct enum_names<recurrence_frequency_t> final {
  static constexpr auto kNames = std::array{
      enum_name_t<recurrence_frequency_t>{"weekly",
          recurrence_frequency_t::weekly},
      enum_name_t<recurrence_frequency_t>{"biweekly",
          recurrence_frequency_t::biweekly},
      enum_name_t<recurrence_frequency_t>{"monthly",
          recurrence_frequency_t::monthly},
      enum_name_t<recurrence_frequency_t>{"quarterly",
          recurrence_frequency_t::quarterly},
  };
};

}  // namespace liquidity::schema

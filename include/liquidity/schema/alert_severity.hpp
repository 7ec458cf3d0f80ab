#pragma once

#include <liquidity/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema type: alert severity.
// Liquidity workflow: urgency attached to a projected-balance alert.
namespace liquidity::schema {

enum class alert_severity_t : uint8_t {
  info = 0,
  warning = 1,
  critical = 2,
};

template <>
struct enum_names<alert_severity_t> final {
  static constexpr auto kNames = std::array{
      enum_name_t<alert_severity_t>{"info", alert_severity_t::info},
      enum_name_t<alert_severity_t>{"warning", alert_severity_t::warning},
      enum_name_t<alert_severity_t>{"critical", alert_severity_t::critical},
  };
};

}  // namespace liquidity::schema

#pragma once

#include <liquidity/schema/alert_severity.hpp>
#include <liquidity/schema/primitives.hpp>
#include <string>

// Schema type: liquidity alert.
namespace liquidity::schema {

template <uint16_t Version>
struct liquidity_alert;

template <>
struct liquidity_alert<1> final {
  uint16_t version{1};
  uint32_t calendar_week{};
  alert_severity_t severity{alert_severity_t::info};
  std::string message;
  amount_t projected_balance{};
};

using liquidity_alert_t = liquidity_alert<1>;

}  // namespace liquidity::schema

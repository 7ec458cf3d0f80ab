#pragma once

#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/primitives.hpp>
#include <liquidity/schema/recurrence_frequency.hpp>
#include <optional>
#include <string>

// Schema type: recurring pattern.
// Liquidity workflow: a cluster of similar historical bookings inferred to
// repeat on a regular cadence. Recomputed on every run.
namespace liquidity::schema {

template <uint16_t Version>
struct recurring_pattern;

template <>
struct recurring_pattern<1> final {
  uint16_t version{1};
  std::string description;
  std::optional<std::string> counterparty;
  amount_t average_amount{};
  recurrence_frequency_t frequency{recurrence_frequency_t::monthly};
  uint8_t typical_day_of_month{1};
  double confidence{};
  uint32_t occurrences{};
  cashflow_direction_t direction{cashflow_direction_t::outflow};
  std::string category;
  account_range_t account_range{};
};

using recurring_pattern_t = recurring_pattern<1>;

}  // namespace liquidity::schema

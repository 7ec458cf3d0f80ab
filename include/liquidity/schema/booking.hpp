#pragma once

#include <liquidity/schema/primitives.hpp>
#include <string>

// Schema type: booking.
// Liquidity workflow: one posted ledger transaction supplied by the caller.
// The sign of `amount` is interpreted relative to the account's category
// direction (see forecast::account_categorizer).
namespace liquidity::schema {

template <uint16_t Version>
struct booking;

template <>
struct booking<1> final {
  uint16_t version{1};
  date_t posting_date{};
  amount_t amount{};
  account_number_t account{};
  std::string counterparty;
  std::string text;
};

using booking_t = booking<1>;

}  // namespace liquidity::schema

#pragma once

#include <liquidity/forecast/options.hpp>
#include <liquidity/schema/account_category.hpp>
#include <liquidity/schema/booking.hpp>
#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace liquidity::forecast {

/// Direction and magnitude of a booking as seen from the bank account.
struct flow_t final {
  schema::cashflow_direction_t direction{schema::cashflow_direction_t::inflow};
  schema::amount_t amount{};
};

/// Maps account numbers to categories and is the only place that decides
/// whether a booking is an inflow or an outflow.
///
/// Lookup walks the rule table in order and returns the first range that
/// contains the account; accounts outside every range fall back to revenue
/// below `boundary_account` and to expense at or above it.
class account_categorizer final {
 public:
  account_categorizer();
  explicit account_categorizer(categorizer_options_t options);

  schema::account_category_t categorize(schema::account_number_t account) const;

  /// A positive amount flows in the category's own direction; a negative
  /// amount (refund, reversal) flows the other way.
  flow_t flow_of(const schema::booking_t& booking) const;

  /// Display color of a category by name, `#9ca3af` when unknown.
  std::string color_of(std::string_view category) const;

  const categorizer_options_t& options() const { return options_; }

 private:
  categorizer_options_t options_;
};

}  // namespace liquidity::forecast

#pragma once

#include <liquidity/forecast/account_categorizer.hpp>
#include <liquidity/forecast/options.hpp>
#include <liquidity/schema/booking.hpp>
#include <liquidity/schema/primitives.hpp>
#include <liquidity/schema/recurring_pattern.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace liquidity::forecast {

/// Lowercase, replace every run of digits with `#`, collapse whitespace runs
/// to a single space and trim.
std::string normalize_description(std::string_view text);

/// Clusters historical bookings by normalized description and counterparty
/// and infers recurring payment patterns.
///
/// The recurrence rate is extrapolated from the occurrences inside the
/// trailing window ending at `now`; groups whose annualized rate falls
/// outside every configured band are dropped rather than guessed.
class pattern_detector final {
 public:
  pattern_detector(const account_categorizer& categorizer,
                   pattern_options_t options);

  /// Patterns sorted by occurrence count, highest first.
  std::vector<schema::recurring_pattern_t> detect(
      const std::vector<schema::booking_t>& bookings,
      schema::date_t now) const;

 private:
  const frequency_band_t* classify(double annual_rate) const;

  const account_categorizer& categorizer_;
  pattern_options_t options_;
};

}  // namespace liquidity::forecast

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <liquidity/forecast/pattern_detector.hpp>
#include <map>
#include <utility>

using namespace liquidity::schema;

namespace {

constexpr auto kUnknownCounterparty = std::string_view{"unknown"};

using group_key_t = std::pair<std::string, std::string>;
using group_map_t = std::map<group_key_t, std::vector<const booking_t*>>;

group_map_t group_bookings(const std::vector<booking_t>& bookings) {
  auto groups = group_map_t{};
  for (const auto& booking : bookings) {
    auto counterparty = booking.counterparty.empty()
                            ? std::string{kUnknownCounterparty}
                            : booking.counterparty;
    auto key = group_key_t{liquidity::forecast::normalize_description(
                               booking.text),
                           std::move(counterparty)};
    groups[std::move(key)].push_back(&booking);
  }
  return groups;
}

}  // namespace

namespace liquidity::forecast {

std::string normalize_description(const std::string_view text) {
  auto out = std::string{};
  out.reserve(text.size());
  auto pending_space = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    auto c = static_cast<unsigned char>(text[i]);
    if (std::isspace(c) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    if (std::isdigit(c) != 0) {
      out.push_back('#');
      while ((i + 1) < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[i + 1])) != 0) {
        ++i;
      }
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

pattern_detector::pattern_detector(const account_categorizer& categorizer,
                                   pattern_options_t options)
    : categorizer_{categorizer}, options_{std::move(options)} {}

const frequency_band_t* pattern_detector::classify(
    const double annual_rate) const {
  for (const auto& band : options_.bands) {
    if (annual_rate < band.min_rate) {
      continue;
    }
    if (band.max_rate.has_value() && annual_rate >= *band.max_rate) {
      continue;
    }
    return &band;
  }
  return nullptr;
}

std::vector<recurring_pattern_t> pattern_detector::detect(
    const std::vector<booking_t>& bookings,
    const date_t now) const {
  auto patterns = std::vector<recurring_pattern_t>{};
  if (bookings.empty()) {
    return patterns;
  }

  auto window_start = now - std::chrono::days{options_.recent_window_days};
  for (const auto& [key, entries] : group_bookings(bookings)) {
    if (entries.size() < options_.min_occurrences) {
      continue;
    }

    auto total_amount = amount_t{};
    auto total_day = 0.0;
    auto recent = std::size_t{0};
    for (const auto* entry : entries) {
      total_amount += std::abs(entry->amount);
      total_day += static_cast<double>(
          static_cast<unsigned>(
              std::chrono::year_month_day{entry->posting_date}.day()));
      if (entry->posting_date >= window_start && entry->posting_date <= now) {
        ++recent;
      }
    }

    auto annual_rate = static_cast<double>(recent) * options_.periods_per_year;
    const auto* band = classify(annual_rate);
    if (band == nullptr) {
      spdlog::debug("Dropping cluster '{}' ({}): {} per year matches no band",
                    key.first, key.second, annual_rate);
      continue;
    }

    const auto& first = *entries.front();
    auto category = categorizer_.categorize(first.account);
    auto mixed = std::any_of(
        std::next(std::begin(entries)), std::end(entries),
        [&](const booking_t* entry) {
          return categorizer_.categorize(entry->account).name != category.name;
        });
    if (mixed) {
      spdlog::debug("Cluster '{}' spans several categories; using '{}'",
                    key.first, category.name);
    }

    auto count = static_cast<double>(entries.size());
    auto typical_day = static_cast<long>(std::lround(total_day / count));
    auto range_start = (first.account / 100) * 100;

    auto pattern = recurring_pattern_t{};
    pattern.description = key.first;
    if (key.second != kUnknownCounterparty) {
      pattern.counterparty = key.second;
    }
    pattern.average_amount = round_currency(total_amount / count);
    pattern.frequency = band->frequency;
    pattern.typical_day_of_month =
        static_cast<uint8_t>(typical_day > 0 ? typical_day : 1);
    pattern.confidence =
        round_ratio(std::min(1.0, annual_rate / band->nominal_rate));
    pattern.occurrences = static_cast<uint32_t>(entries.size());
    pattern.direction = category.direction;
    pattern.category = category.name;
    pattern.account_range = account_range_t{range_start, range_start + 99};
    patterns.push_back(std::move(pattern));
  }

  std::stable_sort(std::begin(patterns), std::end(patterns),
                   [](const recurring_pattern_t& a,
                      const recurring_pattern_t& b) {
                     return a.occurrences > b.occurrences;
                   });
  spdlog::debug("Detected {} recurring pattern(s) in {} booking(s)",
                patterns.size(), bookings.size());
  return patterns;
}

}  // namespace liquidity::forecast

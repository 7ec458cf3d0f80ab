#include <boost/program_options.hpp>
#include <liquidity/config/options_file.hpp>
#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/recurrence_frequency.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

using namespace liquidity::schema;
using namespace liquidity::forecast;

namespace po = boost::program_options;

namespace liquidity::config {

namespace {

std::vector<std::string_view> split_fields(std::string_view text) {
  auto fields = std::vector<std::string_view>{};
  while (true) {
    auto pos = text.find('|');
    auto field = text.substr(0, pos);
    while (!field.empty() && field.front() == ' ') {
      field.remove_prefix(1);
    }
    while (!field.empty() && field.back() == ' ') {
      field.remove_suffix(1);
    }
    fields.push_back(field);
    if (pos == std::string_view::npos) {
      break;
    }
    text.remove_prefix(pos + 1);
  }
  return fields;
}

template <typename T>
std::optional<T> parse_integer(const std::string_view text) {
  auto value = T{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> parse_number(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    auto consumed = std::size_t{};
    auto value = std::stod(std::string{text}, &consumed);
    if (consumed != text.size() || !std::isfinite(value)) {
      return std::nullopt;
    }
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<account_category_rule_t> parse_rule(const std::string& text,
                                                  std::string& error) {
  auto fields = split_fields(text);
  if (fields.size() != 5) {
    error = fmt::format("categories.rule '{}': expected name|first|last|direction|color",
                        text);
    return std::nullopt;
  }
  auto first = parse_integer<account_number_t>(fields[1]);
  auto last = parse_integer<account_number_t>(fields[2]);
  auto direction = try_from_string<cashflow_direction_t>(fields[3]);
  if (fields[0].empty() || fields[4].empty() || !first || !last ||
      *first > *last || !direction) {
    error = fmt::format("categories.rule '{}': malformed value", text);
    return std::nullopt;
  }
  // '#' starts a comment in the file, so colors are written without it.
  auto color = std::string{fields[4]};
  if (!color.starts_with('#')) {
    color.insert(0, 1, '#');
  }
  return account_category_rule_t{.name = std::string{fields[0]},
                                 .range = {*first, *last},
                                 .direction = *direction,
                                 .color = std::move(color)};
}

std::optional<frequency_band_t> parse_band(const std::string& text,
                                           std::string& error) {
  auto fields = split_fields(text);
  if (fields.size() != 5) {
    error = fmt::format(
        "patterns.band '{}': expected frequency|min|max|nominal|cadence", text);
    return std::nullopt;
  }
  auto frequency = try_from_string<recurrence_frequency_t>(fields[0]);
  auto min_rate = parse_number(fields[1]);
  auto max_rate = std::optional<double>{};
  auto max_ok = true;
  if (fields[2] != "inf") {
    max_rate = parse_number(fields[2]);
    max_ok = max_rate.has_value();
  }
  auto nominal = parse_number(fields[3]);
  auto cadence = parse_integer<uint32_t>(fields[4]);
  if (!frequency || !min_rate || !max_ok || !nominal || *nominal <= 0.0 ||
      !cadence || *cadence == 0 || (max_rate && *max_rate <= *min_rate)) {
    error = fmt::format("patterns.band '{}': malformed value", text);
    return std::nullopt;
  }
  return frequency_band_t{.frequency = *frequency,
                          .min_rate = *min_rate,
                          .max_rate = max_rate,
                          .nominal_rate = *nominal,
                          .cadence_weeks = *cadence};
}

bool valid_day(const uint32_t day) {
  return day >= 1 && day <= 31;
}

po::options_description make_description() {
  auto description = po::options_description{"forecast options"};
  description.add_options()
      ("baseline.window_days", po::value<int32_t>())
      ("baseline.weeks_per_window", po::value<double>())
      ("patterns.min_occurrences", po::value<uint32_t>())
      ("patterns.recent_window_days", po::value<int32_t>())
      ("patterns.periods_per_year", po::value<double>())
      ("patterns.band", po::value<std::vector<std::string>>())
      ("confidence.decay_per_week", po::value<double>())
      ("confidence.floor", po::value<double>())
      ("bounds.fallback_std_dev", po::value<double>())
      ("bounds.widening_per_week", po::value<double>())
      ("overlays.factor", po::value<double>())
      ("overlays.payroll_first_day", po::value<uint32_t>())
      ("overlays.payroll_last_day", po::value<uint32_t>())
      ("overlays.rent_first_day", po::value<uint32_t>())
      ("overlays.rent_last_day", po::value<uint32_t>())
      ("overlays.payroll_category", po::value<std::string>())
      ("overlays.rent_category", po::value<std::string>())
      ("alerts.large_drop", po::value<double>())
      ("insights.max_count", po::value<uint32_t>())
      ("horizon.max_weeks", po::value<uint32_t>())
      ("categories.boundary_account", po::value<account_number_t>())
      ("categories.rule", po::value<std::vector<std::string>>());
  return description;
}

template <typename T>
void assign_if_present(const po::variables_map& vm,
                       const char* key,
                       T& target) {
  if (vm.contains(key)) {
    target = vm[key].as<T>();
  }
}

std::optional<forecast_options_t> apply(const po::variables_map& vm,
                                        std::string& error) {
  auto options = default_forecast_options();

  assign_if_present(vm, "baseline.window_days", options.baseline.window_days);
  assign_if_present(vm, "baseline.weeks_per_window",
                    options.baseline.weeks_per_window);
  assign_if_present(vm, "patterns.min_occurrences",
                    options.patterns.min_occurrences);
  assign_if_present(vm, "patterns.recent_window_days",
                    options.patterns.recent_window_days);
  assign_if_present(vm, "patterns.periods_per_year",
                    options.patterns.periods_per_year);
  assign_if_present(vm, "confidence.decay_per_week",
                    options.confidence.decay_per_week);
  assign_if_present(vm, "confidence.floor", options.confidence.floor);
  assign_if_present(vm, "bounds.fallback_std_dev",
                    options.variance.fallback_std_dev);
  assign_if_present(vm, "bounds.widening_per_week",
                    options.variance.widening_per_week);
  assign_if_present(vm, "overlays.factor", options.overlays.factor);
  assign_if_present(vm, "overlays.payroll_first_day",
                    options.overlays.payroll_days.first_day);
  assign_if_present(vm, "overlays.payroll_last_day",
                    options.overlays.payroll_days.last_day);
  assign_if_present(vm, "overlays.rent_first_day",
                    options.overlays.rent_days.first_day);
  assign_if_present(vm, "overlays.rent_last_day",
                    options.overlays.rent_days.last_day);
  assign_if_present(vm, "overlays.payroll_category",
                    options.overlays.payroll_category);
  assign_if_present(vm, "overlays.rent_category",
                    options.overlays.rent_category);
  assign_if_present(vm, "alerts.large_drop", options.alerts.large_drop);
  assign_if_present(vm, "categories.boundary_account",
                    options.categorizer.boundary_account);
  assign_if_present(vm, "horizon.max_weeks", options.horizon.max_weeks);
  if (vm.contains("insights.max_count")) {
    options.insights.max_count = vm["insights.max_count"].as<uint32_t>();
  }

  if (vm.contains("categories.rule")) {
    options.categorizer.rules.clear();
    for (const auto& text : vm["categories.rule"].as<std::vector<std::string>>()) {
      auto rule = parse_rule(text, error);
      if (!rule) {
        return std::nullopt;
      }
      options.categorizer.rules.push_back(std::move(*rule));
    }
  }

  if (vm.contains("patterns.band")) {
    options.patterns.bands.clear();
    for (const auto& text : vm["patterns.band"].as<std::vector<std::string>>()) {
      auto band = parse_band(text, error);
      if (!band) {
        return std::nullopt;
      }
      if (find_band(options.patterns.bands, band->frequency) != nullptr) {
        error = fmt::format("patterns.band '{}': duplicate frequency", text);
        return std::nullopt;
      }
      options.patterns.bands.push_back(*band);
    }
  }

  if (options.baseline.window_days <= 0 ||
      !(options.baseline.weeks_per_window > 0.0)) {
    error = "baseline: window_days and weeks_per_window must be positive";
    return std::nullopt;
  }
  if (options.patterns.min_occurrences == 0 ||
      options.patterns.recent_window_days < 0 ||
      !(options.patterns.periods_per_year > 0.0)) {
    error = "patterns: min_occurrences and periods_per_year must be positive";
    return std::nullopt;
  }
  if (options.confidence.floor < 0.0 || options.confidence.floor > 1.0 ||
      options.confidence.decay_per_week < 0.0) {
    error = "confidence: floor must lie in [0, 1] and decay must not be negative";
    return std::nullopt;
  }
  if (options.variance.fallback_std_dev < 0.0 ||
      options.variance.widening_per_week < 0.0) {
    error = "bounds: values must not be negative";
    return std::nullopt;
  }
  const auto& payroll = options.overlays.payroll_days;
  const auto& rent = options.overlays.rent_days;
  if (!valid_day(payroll.first_day) || !valid_day(payroll.last_day) ||
      payroll.first_day > payroll.last_day || !valid_day(rent.first_day) ||
      !valid_day(rent.last_day) || rent.first_day > rent.last_day) {
    error = "overlays: day windows must lie within 1..31 with first <= last";
    return std::nullopt;
  }
  if (options.horizon.max_weeks == 0) {
    error = "horizon: max_weeks must be positive";
    return std::nullopt;
  }
  if (options.overlays.factor < 0.0) {
    error = "overlays: factor must not be negative";
    return std::nullopt;
  }
  return options;
}

}  // namespace

std::optional<forecast_options_t> parse_forecast_options(std::istream& input,
                                                         std::string& error) {
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, make_description(), false), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }
  return liquidity::config::apply(vm, error);
}

std::optional<forecast_options_t> load_forecast_options(
    const std::filesystem::path& path,
    std::string& error) {
  auto input = std::ifstream{path};
  if (!input) {
    error = fmt::format("cannot read options file {}", path.string());
    return std::nullopt;
  }
  auto options = parse_forecast_options(input, error);
  if (!options) {
    error = fmt::format("{}: {}", path.string(), error);
    return std::nullopt;
  }
  spdlog::debug("loaded forecast options from {}", path.string());
  return options;
}

}  // namespace liquidity::config

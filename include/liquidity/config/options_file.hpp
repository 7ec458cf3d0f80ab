#pragma once

#include <liquidity/forecast/options.hpp>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace liquidity::config {

/// Read forecast tuning options from an INI file.
///
/// Keys absent from the file keep their defaults. A `categories.rule` or
/// `patterns.band` list replaces the default list as a whole. Returns an
/// empty optional and fills `error` when the file cannot be read, names an
/// unknown key or carries a malformed value.
std::optional<forecast::forecast_options_t> load_forecast_options(
    const std::filesystem::path& path,
    std::string& error);

std::optional<forecast::forecast_options_t> parse_forecast_options(
    std::istream& input,
    std::string& error);

}  // namespace liquidity::config

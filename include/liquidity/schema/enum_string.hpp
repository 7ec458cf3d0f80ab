#pragma once

#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

namespace liquidity::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

// Specialized next to each enum that has textual names, with a `kNames`
// array of enum_name_t entries.
template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  const auto& names = enum_names<Enum>::kNames;
  auto it = std::find_if(std::begin(names), std::end(names),
                         [&](const enum_name_t<Enum>& entry) {
                           return entry.first == value;
                         });
  if (it == std::end(names)) {
    return std::nullopt;
  }
  return it->second;
}

/// Textual name of an enum value, `unknown` for values without a name.
template <typename Enum>
constexpr std::string_view to_string(const Enum value) {
  const auto& names = enum_names<Enum>::kNames;
  auto it = std::find_if(std::begin(names), std::end(names),
                         [&](const enum_name_t<Enum>& entry) {
                           return entry.second == value;
                         });
  if (it == std::end(names)) {
    return "unknown";
  }
  return it->first;
}

}  // namespace liquidity::schema

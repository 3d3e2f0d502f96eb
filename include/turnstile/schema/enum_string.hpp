#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace turnstile::schema {

/// Name table for an enum that appears on the wire or in logs.
template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

inline constexpr auto kUnknownName = std::string_view{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup_value(const enum_names_t<Enum, N>& names,
                                           const std::string_view name) {
  const auto it = std::find_if(names.begin(), names.end(), [&](const auto& entry) {
    return entry.first == name;
  });
  if (it == names.end()) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const enum_names_t<Enum, N>& names,
                                   const Enum value) {
  const auto it = std::find_if(names.begin(), names.end(), [&](const auto& entry) {
    return entry.second == value;
  });
  return it == names.end() ? kUnknownName : it->first;
}

// Defined next to each enum that can be parsed back from text.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace turnstile::schema

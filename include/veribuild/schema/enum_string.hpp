#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace veribuild::schema {

/// Name table for an enum; names are the wire and database spelling.
template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup_enum(const std::string_view name,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& [candidate, value] : names) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view lookup_name(const Enum value,
                                       const enum_names_t<Enum, N>& names) {
  for (const auto& [name, candidate] : names) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

/// Specialized next to each enum that is persisted or sent on the wire.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value);

}  // namespace veribuild::schema

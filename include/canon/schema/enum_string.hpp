#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace canon::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

inline constexpr auto kUnknownEnumName = std::string_view{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

/// Name of a mapped enum value, or "unknown" for a value with no mapping.
template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return kUnknownEnumName;
}

/// Specialised next to each enum's mapping table. Enums without one do not
/// link.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace canon::schema

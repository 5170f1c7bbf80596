#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace zkaffinity::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Every name in table order, joined by `separator`. Used in messages that
/// list the accepted values.
template <typename Enum, std::size_t N>
std::string join_names(
    const std::array<std::pair<std::string_view, Enum>, N>& mappings,
    const std::string_view separator = ", ") {
  auto out = std::string{};
  for (const auto& [name, unused] : mappings) {
    if (!out.empty()) {
      out += separator;
    }
    out += name;
  }
  return out;
}

}  // namespace zkaffinity::schema

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Name <-> value lookups over constexpr mapping tables. Every wire enum
// carries one table so tooling and logs can speak in names.
namespace perp::schema {

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

/// Joins every name of a mapping table, e.g. "short|long" for help text.
template <typename Enum, std::size_t N>
std::string join_names(
    const std::array<std::pair<std::string_view, Enum>, N>& mappings,
    const std::string_view separator = "|") {
  auto out = std::string{};
  for (const auto& mapping : mappings) {
    if (!out.empty()) {
      out.append(separator);
    }
    out.append(mapping.first);
  }
  return out;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace perp::schema

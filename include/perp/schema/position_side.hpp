#pragma once

#include <perp/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: position side.
// Direction of a position; encoded on the wire as a single byte.
namespace perp::schema {

enum class position_side_t : uint8_t { short_position = 0, long_position = 1 };

inline constexpr auto kPositionSideMappings =
    std::array{std::pair<std::string_view, position_side_t>{
                   "short", position_side_t::short_position},
               std::pair<std::string_view, position_side_t>{
                   "long", position_side_t::long_position}};

template <>
inline std::optional<position_side_t> try_from_string<position_side_t>(
    const std::string_view value) {
  return from_string(value, kPositionSideMappings);
}

inline constexpr std::string_view to_string(const position_side_t value) {
  return to_string(value, kPositionSideMappings).value_or("unknown");
}

}  // namespace perp::schema

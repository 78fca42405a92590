#pragma once
#include <cstdint>

// Schema type: transfer position.
// Moves one position between two user accounts.
namespace perp::schema {

template <uint16_t Version>
struct transfer_position;

template <>
struct transfer_position<1> final {
  uint16_t position_index{};

  bool operator==(const transfer_position&) const = default;
};

using transfer_position_t = transfer_position<1>;

}  // namespace perp::schema

#pragma once
#include <cstdint>

// Schema type: increase position.
// Adds collateral to an existing position.
namespace perp::schema {

template <uint16_t Version>
struct increase_position;

template <>
struct increase_position<1> final {
  uint64_t add_collateral{};
  uint8_t instance_index{};
  uint64_t leverage{};
  uint16_t position_index{};
  uint64_t predicted_entry_price{};  // 32 bit fixed point
  uint64_t maximum_slippage_margin{};  // 32 bit fixed point

  bool operator==(const increase_position&) const = default;
};

using increase_position_t = increase_position<1>;

}  // namespace perp::schema

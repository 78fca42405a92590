#pragma once
#include <perp/schema/position_side.hpp>
#include <cstdint>

// Schema type: open position.
// Opens a leveraged position on one instance of the market.
namespace perp::schema {

template <uint16_t Version>
struct open_position;

template <>
struct open_position<1> final {
  position_side_t side{};
  uint64_t collateral{};
  uint8_t instance_index{};
  uint64_t leverage{};
  uint64_t predicted_entry_price{};  // 32 bit fixed point
  uint64_t maximum_slippage_margin{};  // 32 bit fixed point

  bool operator==(const open_position&) const = default;
};

using open_position_t = open_position<1>;

}  // namespace perp::schema

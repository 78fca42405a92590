#pragma once
#include <cstdint>

// Schema type: close position.
// Closes all or part of a position.
namespace perp::schema {

template <uint16_t Version>
struct close_position;

template <>
struct close_position<1> final {
  uint16_t position_index{};
  uint64_t closing_collateral{};
  uint64_t closing_v_coin{};
  uint64_t predicted_entry_price{};  // 32 bit fixed point
  uint64_t maximum_slippage_margin{};  // 32 bit fixed point

  bool operator==(const close_position&) const = default;
};

using close_position_t = close_position<1>;

}  // namespace perp::schema

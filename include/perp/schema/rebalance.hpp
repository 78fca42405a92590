#pragma once
#include <cstdint>

namespace perp::schema {

template <uint16_t Version>
struct rebalance;

template <>
struct rebalance<1> final {
  uint64_t collateral{};
  uint8_t instance_index{};

  bool operator==(const rebalance&) const = default;
};

using rebalance_t = rebalance<1>;

}  // namespace perp::schema

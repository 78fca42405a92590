#pragma once
#include <cstdint>

// Schema type: crank liquidation.
// Liquidates losing positions of one instance.
namespace perp::schema {

template <uint16_t Version>
struct crank_liquidation;

template <>
struct crank_liquidation<1> final {
  uint8_t instance_index{};

  bool operator==(const crank_liquidation&) const = default;
};

using crank_liquidation_t = crank_liquidation<1>;

}  // namespace perp::schema

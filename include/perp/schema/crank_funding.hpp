#pragma once
#include <cstdint>

// Schema type: crank funding.
// Records index and mark prices for the funding ratio.
namespace perp::schema {

template <uint16_t Version>
struct crank_funding;

template <>
struct crank_funding<1> final {
  bool operator==(const crank_funding&) const = default;
};

using crank_funding_t = crank_funding<1>;

}  // namespace perp::schema

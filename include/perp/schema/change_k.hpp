#pragma once
#include <cstdint>

namespace perp::schema {

template <uint16_t Version>
struct change_k;

template <>
struct change_k<1> final {
  uint64_t factor{};

  bool operator==(const change_k&) const = default;
};

using change_k_t = change_k<1>;

}  // namespace perp::schema

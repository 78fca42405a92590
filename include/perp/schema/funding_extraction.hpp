#pragma once
#include <cstdint>

namespace perp::schema {

template <uint16_t Version>
struct funding_extraction;

template <>
struct funding_extraction<1> final {
  uint8_t instance_index{};

  bool operator==(const funding_extraction&) const = default;
};

using funding_extraction_t = funding_extraction<1>;

}  // namespace perp::schema

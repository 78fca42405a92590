#pragma once
#include <cstdint>

// Schema type: collect garbage.
// Frees stale slots in an instance's position pages; the caller is paid
// a flat fee per freed slot.
namespace perp::schema {

template <uint16_t Version>
struct collect_garbage;

template <>
struct collect_garbage<1> final {
  uint8_t instance_index{};
  uint64_t max_iterations{};

  bool operator==(const collect_garbage&) const = default;
};

using collect_garbage_t = collect_garbage<1>;

}  // namespace perp::schema

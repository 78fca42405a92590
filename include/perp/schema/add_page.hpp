#pragma once
#include <cstdint>

// Schema type: add page.
// Registers one more position page with an instance.
namespace perp::schema {

template <uint16_t Version>
struct add_page;

template <>
struct add_page<1> final {
  uint8_t instance_index{};

  bool operator==(const add_page&) const = default;
};

using add_page_t = add_page<1>;

}  // namespace perp::schema

#pragma once
#include <cstdint>

namespace perp::schema {

template <uint16_t Version>
struct add_instance;

template <>
struct add_instance<1> final {
  bool operator==(const add_instance&) const = default;
};

using add_instance_t = add_instance<1>;

}  // namespace perp::schema

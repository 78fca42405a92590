#pragma once
#include <cstdint>

// Schema type: add budget.
// Moves quote tokens from the user into the user account budget.
namespace perp::schema {

template <uint16_t Version>
struct add_budget;

template <>
struct add_budget<1> final {
  uint64_t amount{};

  bool operator==(const add_budget&) const = default;
};

using add_budget_t = add_budget<1>;

}  // namespace perp::schema

#pragma once
#include <cstdint>

namespace perp::schema {

template <uint16_t Version>
struct withdraw_budget;

template <>
struct withdraw_budget<1> final {
  uint64_t amount{};

  bool operator==(const withdraw_budget&) const = default;
};

using withdraw_budget_t = withdraw_budget<1>;

}  // namespace perp::schema

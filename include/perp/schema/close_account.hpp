#pragma once
#include <cstdint>

namespace perp::schema {

template <uint16_t Version>
struct close_account;

template <>
struct close_account<1> final {
  bool operator==(const close_account&) const = default;
};

using close_account_t = close_account<1>;

}  // namespace perp::schema

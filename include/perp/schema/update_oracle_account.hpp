#pragma once
#include <cstdint>

// Schema type: update oracle account.
// Re-points the market at the oracle price account.
namespace perp::schema {

template <uint16_t Version>
struct update_oracle_account;

template <>
struct update_oracle_account<1> final {
  bool operator==(const update_oracle_account&) const = default;
};

using update_oracle_account_t = update_oracle_account<1>;

}  // namespace perp::schema

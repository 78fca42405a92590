#pragma once
#include <cstdint>

// Schema type: transfer user account.
// Hands a user account to a new owner.
namespace perp::schema {

template <uint16_t Version>
struct transfer_user_account;

template <>
struct transfer_user_account<1> final {
  bool operator==(const transfer_user_account&) const = default;
};

using transfer_user_account_t = transfer_user_account<1>;

}  // namespace perp::schema

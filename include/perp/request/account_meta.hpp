#pragma once
#include <perp/schema/primitives.hpp>

namespace perp::request {

/// One positional entry of a request's account list.
struct account_meta final {
  perp::schema::public_key_t pubkey{};
  bool is_writable{};
  bool is_signer{};

  bool operator==(const account_meta&) const = default;
};

using account_meta_t = account_meta;

inline account_meta_t make_writable(const perp::schema::public_key_t& pubkey,
                                    const bool is_signer = false) {
  return account_meta_t{
      .pubkey = pubkey, .is_writable = true, .is_signer = is_signer};
}

inline account_meta_t make_readonly(const perp::schema::public_key_t& pubkey,
                                    const bool is_signer = false) {
  return account_meta_t{
      .pubkey = pubkey, .is_writable = false, .is_signer = is_signer};
}

}  // namespace perp::request

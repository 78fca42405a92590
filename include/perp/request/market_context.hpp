#pragma once
#include <perp/schema/position_side.hpp>
#include <perp/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace perp::request {

/// One trading instance: its account and the pages that shard its
/// positions book, in the order the engine stored them.
struct instance_context final {
  perp::schema::public_key_t instance_account{};
  std::vector<perp::schema::public_key_t> memory_pages;
};

using instance_context_t = instance_context;

struct market_context final {
  perp::schema::public_key_t program_id{};
  uint8_t signer_nonce{};
  perp::schema::public_key_t market_signer_account{};
  perp::schema::public_key_t oracle_account{};
  perp::schema::public_key_t market_account{};
  perp::schema::public_key_t admin_account{};
  perp::schema::public_key_t market_vault{};
  // Receives the protocol share of trading fees.
  perp::schema::public_key_t fee_sink{};
  std::vector<instance_context_t> instances;
};

using market_context_t = market_context;

struct discount_account final {
  perp::schema::public_key_t owner{};
  perp::schema::public_key_t address{};
};

using discount_account_t = discount_account;

struct position_info final {
  perp::schema::public_key_t user_account{};
  perp::schema::public_key_t user_account_owner{};
  uint8_t instance_index{};
  perp::schema::position_side_t side{};
};

using position_info_t = position_info;

/// Checked instance lookup; nullptr when `index` has no entry.
inline const instance_context_t* find_instance(const market_context_t& ctx,
                                               const uint8_t index) {
  if (index >= ctx.instances.size()) {
    return nullptr;
  }
  return &ctx.instances[index];
}

}  // namespace perp::request

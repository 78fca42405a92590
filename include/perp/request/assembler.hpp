#pragma once

#include <perp/request/account_list_builder.hpp>
#include <perp/request/build_result.hpp>
#include <perp/request/market_context.hpp>
#include <perp/request/well_known_accounts.hpp>
#include <perp/schema/encoding/borsh/encoder.hpp>
#include <perp/schema/instruction.hpp>
#include <perp/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace perp::request {

using borsh_encoder_t = perp::schema::encoding::encoder<
    perp::schema::encoding::borsh_encoder_tag>;

/// Builds unsigned requests for the perpetuals execution engine.
///
/// Each operation maps a market context plus per-call identities to the
/// engine's program id, its positional account list and the encoded
/// payload. Account positions are part of the wire contract: the engine
/// reads them by index.
///
/// All members are const and never touch shared mutable state, so one
/// assembler may serve any number of threads.
class assembler final {
 public:
  /// `accounts` is the constant identity table, normally `well_known()`.
  explicit assembler(borsh_encoder_t& encoder,
                     const well_known_accounts_t& accounts = well_known());

  /// Create a market. The signer nonce is taken from `ctx`.
  ///
  /// Accounts: market(w), clock(r), oracle(r), admin(r), vault(r).
  build_result_t create_market(const market_context_t& ctx,
                               std::string market_symbol,
                               uint64_t initial_v_quote_amount,
                               uint8_t coin_decimals,
                               uint8_t quote_decimals) const;

  /// Register a new instance together with its initial pages.
  ///
  /// Accounts: market(w), admin(w, s), instance(w), pages(w)...
  build_result_t add_instance(
      const market_context_t& ctx,
      const perp::schema::public_key_t& instance_account,
      const std::vector<perp::schema::public_key_t>& memory_pages) const;

  /// Accounts: market(w), oracle mapping(r), oracle product(r),
  /// oracle price(r).
  build_result_t update_oracle_account(
      const market_context_t& ctx,
      const perp::schema::public_key_t& oracle_mapping_account,
      const perp::schema::public_key_t& oracle_product_account,
      const perp::schema::public_key_t& oracle_price_account) const;

  /// Open a position on `position.instance_index`.
  ///
  /// Accounts: token program(r), clock(r), market(w), instance(w),
  /// market signer(r), vault(w), fee sink(w), owner(r, s), user account(w),
  /// trade label(r), oracle(r), pages(w)..., [discount address(r),
  /// discount owner(r, s)], [referrer(w)].
  build_result_t open_position(
      const market_context_t& ctx,
      const position_info_t& position,
      uint64_t collateral,
      uint64_t leverage,
      uint64_t predicted_entry_price,
      uint64_t maximum_slippage_margin,
      const std::optional<discount_account_t>& discount = std::nullopt,
      const std::optional<perp::schema::public_key_t>& referrer =
          std::nullopt) const;

  /// Accounts: token program(r), market(w), vault(w), user account(w),
  /// source owner(r, s), source token account(w).
  build_result_t add_budget(
      const market_context_t& ctx,
      uint64_t amount,
      const perp::schema::public_key_t& source_owner,
      const perp::schema::public_key_t& source_token_account,
      const perp::schema::public_key_t& user_account) const;

  /// Accounts: token program(r), market(w), market signer(r), vault(w),
  /// user account owner(r, s), user account(w), target token account(w).
  build_result_t withdraw_budget(
      const market_context_t& ctx,
      uint64_t amount,
      const perp::schema::public_key_t& target_token_account,
      const perp::schema::public_key_t& user_account_owner,
      const perp::schema::public_key_t& user_account) const;

  /// Add collateral to an open position.
  ///
  /// Accounts: token program(r), clock(r), market(w), market signer(r),
  /// vault(w), fee sink(w), instance(w), owner(r, s), user account(w),
  /// trade label(r), oracle(r), pages(w)..., [discount], [referrer].
  build_result_t increase_position(
      const market_context_t& ctx,
      uint64_t add_collateral,
      uint64_t leverage,
      uint8_t instance_index,
      uint16_t position_index,
      const perp::schema::public_key_t& position_owner,
      const perp::schema::public_key_t& user_account,
      uint64_t predicted_entry_price,
      uint64_t maximum_slippage_margin,
      const std::optional<discount_account_t>& discount = std::nullopt,
      const std::optional<perp::schema::public_key_t>& referrer =
          std::nullopt) const;

  /// Close all or part of a position.
  ///
  /// Accounts: token program(r), clock(r), market(w), instance(w),
  /// market signer(r), vault(w), fee sink(w), oracle(r), owner(r, s),
  /// user account(w), trade label(r), pages(w)..., [discount], [referrer].
  build_result_t close_position(
      const market_context_t& ctx,
      const position_info_t& position,
      uint64_t closing_collateral,
      uint64_t closing_v_coin,
      uint16_t position_index,
      uint64_t predicted_entry_price,
      uint64_t maximum_slippage_margin,
      const std::optional<discount_account_t>& discount = std::nullopt,
      const std::optional<perp::schema::public_key_t>& referrer =
          std::nullopt) const;

  /// Accounts: token program(r), market(w), instance(w), vault(w),
  /// market signer(r), target token account(w), pages(w)...
  build_result_t collect_garbage(
      const market_context_t& ctx,
      uint8_t instance_index,
      uint64_t max_iterations,
      const perp::schema::public_key_t& target_token_account) const;

  /// Accounts: token program(r), market(w), instance(w), market signer(r),
  /// fee sink(w), vault(w), oracle(r), target token account(w),
  /// liquidation label(r), pages(w)...
  build_result_t crank_liquidation(
      const market_context_t& ctx,
      uint8_t instance_index,
      const perp::schema::public_key_t& target_token_account) const;

  /// Accounts: clock(r), market(w), oracle(r), funding label(r).
  build_result_t crank_funding(const market_context_t& ctx) const;

  /// Accounts: market(w), instance(w), user account(w),
  /// funding extraction label(r), oracle(r), pages(w)...
  build_result_t funding_extraction(
      const market_context_t& ctx,
      uint8_t instance_index,
      const perp::schema::public_key_t& user_account) const;

  /// Accounts: market(w), admin(r, s).
  build_result_t change_k(const market_context_t& ctx, uint64_t factor) const;

  /// Accounts: user account(w), owner(r, s), lamports target(w).
  build_result_t close_account(
      const market_context_t& ctx,
      const perp::schema::public_key_t& user_account,
      const perp::schema::public_key_t& user_account_owner,
      const perp::schema::public_key_t& lamports_target) const;

  /// Accounts: market(r), admin(r, s), instance(w), new page(r).
  build_result_t add_page(
      const market_context_t& ctx,
      uint8_t instance_index,
      const perp::schema::public_key_t& new_memory_page) const;

  /// Accounts: token program(r), clock(r), market(w), instance(w),
  /// market signer(r), vault(w), fee sink(w), owner(r, s), user account(w),
  /// admin(r, s), pages(w)...
  build_result_t rebalance(const market_context_t& ctx,
                           const perp::schema::public_key_t& user_account,
                           const perp::schema::public_key_t& user_account_owner,
                           uint8_t instance_index,
                           uint64_t collateral) const;

  /// Accounts: owner(r, s), user account(w), new owner(r).
  build_result_t transfer_user_account(
      const market_context_t& ctx,
      const perp::schema::public_key_t& user_account,
      const perp::schema::public_key_t& user_account_owner,
      const perp::schema::public_key_t& new_user_account_owner) const;

  /// Accounts: source owner(r, s), source account(w),
  /// destination owner(r, s), destination account(w).
  build_result_t transfer_position(
      const market_context_t& ctx,
      uint16_t position_index,
      const perp::schema::public_key_t& source_user_account,
      const perp::schema::public_key_t& source_user_account_owner,
      const perp::schema::public_key_t& destination_user_account,
      const perp::schema::public_key_t& destination_user_account_owner) const;

  const well_known_accounts_t& accounts() const { return accounts_; }

 private:
  /// Seal the account list and encode the payload into one request.
  build_result_t finish(
      const market_context_t& ctx,
      account_list_builder& accounts,
      const perp::schema::instruction_payload_t& payload) const;

  build_result_t invalid_instance(perp::schema::instruction_tag_t tag,
                                  const market_context_t& ctx,
                                  uint8_t instance_index) const;

  borsh_encoder_t& encoder_;
  well_known_accounts_t accounts_;
};

}  // namespace perp::request

#include <perp/request/assembler.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace perp::request {

namespace {

// token program, clock, market, instance, signer, vault, fee sink, owner,
// user account, label, oracle.
constexpr auto kTradePrefixSize = std::size_t{11};
// Discount pair plus referrer.
constexpr auto kOptionalTailSize = std::size_t{3};

}  // namespace

assembler::assembler(borsh_encoder_t& encoder,
                     const well_known_accounts_t& accounts)
    : encoder_{encoder}, accounts_{accounts} {}

build_result_t assembler::create_market(const market_context_t& ctx,
                                        std::string market_symbol,
                                        const uint64_t initial_v_quote_amount,
                                        const uint8_t coin_decimals,
                                        const uint8_t quote_decimals) const {
  auto accounts = account_list_builder{5};
  accounts.fixed(make_writable(ctx.market_account))
      .fixed(make_readonly(accounts_.clock_sysvar))
      .fixed(make_readonly(ctx.oracle_account))
      .fixed(make_readonly(ctx.admin_account))
      .fixed(make_readonly(ctx.market_vault));
  return finish(ctx, accounts,
                perp::schema::create_market_t{
                    .signer_nonce = ctx.signer_nonce,
                    .market_symbol = std::move(market_symbol),
                    .initial_v_quote_amount = initial_v_quote_amount,
                    .coin_decimals = coin_decimals,
                    .quote_decimals = quote_decimals});
}

build_result_t assembler::add_instance(
    const market_context_t& ctx,
    const perp::schema::public_key_t& instance_account,
    const std::vector<perp::schema::public_key_t>& memory_pages) const {
  auto accounts = account_list_builder{3 + memory_pages.size()};
  accounts.fixed(make_writable(ctx.market_account))
      .fixed(make_writable(ctx.admin_account, true))
      .fixed(make_writable(instance_account))
      .pages(memory_pages);
  return finish(ctx, accounts, perp::schema::add_instance_t{});
}

build_result_t assembler::update_oracle_account(
    const market_context_t& ctx,
    const perp::schema::public_key_t& oracle_mapping_account,
    const perp::schema::public_key_t& oracle_product_account,
    const perp::schema::public_key_t& oracle_price_account) const {
  auto accounts = account_list_builder{4};
  accounts.fixed(make_writable(ctx.market_account))
      .fixed(make_readonly(oracle_mapping_account))
      .fixed(make_readonly(oracle_product_account))
      .fixed(make_readonly(oracle_price_account));
  return finish(ctx, accounts, perp::schema::update_oracle_account_t{});
}

build_result_t assembler::open_position(
    const market_context_t& ctx,
    const position_info_t& position,
    const uint64_t collateral,
    const uint64_t leverage,
    const uint64_t predicted_entry_price,
    const uint64_t maximum_slippage_margin,
    const std::optional<discount_account_t>& discount,
    const std::optional<perp::schema::public_key_t>& referrer) const {
  auto instance = find_instance(ctx, position.instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::open_position, ctx,
                            position.instance_index);
  }

  auto accounts = account_list_builder{
      kTradePrefixSize + instance->memory_pages.size() + kOptionalTailSize};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_readonly(accounts_.clock_sysvar))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_writable(ctx.fee_sink))
      .fixed(make_readonly(position.user_account_owner, true))
      .fixed(make_writable(position.user_account))
      .fixed(make_readonly(accounts_.trade_label))
      .fixed(make_readonly(ctx.oracle_account))
      .pages(instance->memory_pages)
      .discount(discount)
      .referrer(referrer);
  return finish(ctx, accounts,
                perp::schema::open_position_t{
                    .side = position.side,
                    .collateral = collateral,
                    .instance_index = position.instance_index,
                    .leverage = leverage,
                    .predicted_entry_price = predicted_entry_price,
                    .maximum_slippage_margin = maximum_slippage_margin});
}

build_result_t assembler::add_budget(
    const market_context_t& ctx,
    const uint64_t amount,
    const perp::schema::public_key_t& source_owner,
    const perp::schema::public_key_t& source_token_account,
    const perp::schema::public_key_t& user_account) const {
  auto accounts = account_list_builder{6};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_writable(user_account))
      .fixed(make_readonly(source_owner, true))
      .fixed(make_writable(source_token_account));
  return finish(ctx, accounts, perp::schema::add_budget_t{.amount = amount});
}

build_result_t assembler::withdraw_budget(
    const market_context_t& ctx,
    const uint64_t amount,
    const perp::schema::public_key_t& target_token_account,
    const perp::schema::public_key_t& user_account_owner,
    const perp::schema::public_key_t& user_account) const {
  auto accounts = account_list_builder{7};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_readonly(user_account_owner, true))
      .fixed(make_writable(user_account))
      .fixed(make_writable(target_token_account));
  return finish(ctx, accounts,
                perp::schema::withdraw_budget_t{.amount = amount});
}

build_result_t assembler::increase_position(
    const market_context_t& ctx,
    const uint64_t add_collateral,
    const uint64_t leverage,
    const uint8_t instance_index,
    const uint16_t position_index,
    const perp::schema::public_key_t& position_owner,
    const perp::schema::public_key_t& user_account,
    const uint64_t predicted_entry_price,
    const uint64_t maximum_slippage_margin,
    const std::optional<discount_account_t>& discount,
    const std::optional<perp::schema::public_key_t>& referrer) const {
  auto instance = find_instance(ctx, instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::increase_position,
                            ctx, instance_index);
  }

  // The instance follows the fee sink here, unlike open and close.
  auto accounts = account_list_builder{
      kTradePrefixSize + instance->memory_pages.size() + kOptionalTailSize};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_readonly(accounts_.clock_sysvar))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_writable(ctx.fee_sink))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_readonly(position_owner, true))
      .fixed(make_writable(user_account))
      .fixed(make_readonly(accounts_.trade_label))
      .fixed(make_readonly(ctx.oracle_account))
      .pages(instance->memory_pages)
      .discount(discount)
      .referrer(referrer);
  return finish(ctx, accounts,
                perp::schema::increase_position_t{
                    .add_collateral = add_collateral,
                    .instance_index = instance_index,
                    .leverage = leverage,
                    .position_index = position_index,
                    .predicted_entry_price = predicted_entry_price,
                    .maximum_slippage_margin = maximum_slippage_margin});
}

build_result_t assembler::close_position(
    const market_context_t& ctx,
    const position_info_t& position,
    const uint64_t closing_collateral,
    const uint64_t closing_v_coin,
    const uint16_t position_index,
    const uint64_t predicted_entry_price,
    const uint64_t maximum_slippage_margin,
    const std::optional<discount_account_t>& discount,
    const std::optional<perp::schema::public_key_t>& referrer) const {
  auto instance = find_instance(ctx, position.instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::close_position,
                            ctx, position.instance_index);
  }

  auto accounts = account_list_builder{
      kTradePrefixSize + instance->memory_pages.size() + kOptionalTailSize};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_readonly(accounts_.clock_sysvar))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_writable(ctx.fee_sink))
      .fixed(make_readonly(ctx.oracle_account))
      .fixed(make_readonly(position.user_account_owner, true))
      .fixed(make_writable(position.user_account))
      .fixed(make_readonly(accounts_.trade_label))
      .pages(instance->memory_pages)
      .discount(discount)
      .referrer(referrer);
  return finish(ctx, accounts,
                perp::schema::close_position_t{
                    .position_index = position_index,
                    .closing_collateral = closing_collateral,
                    .closing_v_coin = closing_v_coin,
                    .predicted_entry_price = predicted_entry_price,
                    .maximum_slippage_margin = maximum_slippage_margin});
}

build_result_t assembler::collect_garbage(
    const market_context_t& ctx,
    const uint8_t instance_index,
    const uint64_t max_iterations,
    const perp::schema::public_key_t& target_token_account) const {
  auto instance = find_instance(ctx, instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::collect_garbage,
                            ctx, instance_index);
  }

  auto accounts = account_list_builder{6 + instance->memory_pages.size()};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(target_token_account))
      .pages(instance->memory_pages);
  return finish(ctx, accounts,
                perp::schema::collect_garbage_t{
                    .instance_index = instance_index,
                    .max_iterations = max_iterations});
}

build_result_t assembler::crank_liquidation(
    const market_context_t& ctx,
    const uint8_t instance_index,
    const perp::schema::public_key_t& target_token_account) const {
  auto instance = find_instance(ctx, instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::crank_liquidation,
                            ctx, instance_index);
  }

  auto accounts = account_list_builder{9 + instance->memory_pages.size()};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(ctx.fee_sink))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_readonly(ctx.oracle_account))
      .fixed(make_writable(target_token_account))
      .fixed(make_readonly(accounts_.liquidation_label))
      .pages(instance->memory_pages);
  return finish(
      ctx, accounts,
      perp::schema::crank_liquidation_t{.instance_index = instance_index});
}

build_result_t assembler::crank_funding(const market_context_t& ctx) const {
  auto accounts = account_list_builder{4};
  accounts.fixed(make_readonly(accounts_.clock_sysvar))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_readonly(ctx.oracle_account))
      .fixed(make_readonly(accounts_.funding_label));
  return finish(ctx, accounts, perp::schema::crank_funding_t{});
}

build_result_t assembler::funding_extraction(
    const market_context_t& ctx,
    const uint8_t instance_index,
    const perp::schema::public_key_t& user_account) const {
  auto instance = find_instance(ctx, instance_index);
  if (instance == nullptr) {
    return invalid_instance(
        perp::schema::instruction_tag_t::funding_extraction, ctx,
        instance_index);
  }

  auto accounts = account_list_builder{5 + instance->memory_pages.size()};
  accounts.fixed(make_writable(ctx.market_account))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_writable(user_account))
      .fixed(make_readonly(accounts_.funding_extraction_label))
      .fixed(make_readonly(ctx.oracle_account))
      .pages(instance->memory_pages);
  return finish(
      ctx, accounts,
      perp::schema::funding_extraction_t{.instance_index = instance_index});
}

build_result_t assembler::change_k(const market_context_t& ctx,
                                   const uint64_t factor) const {
  auto accounts = account_list_builder{2};
  accounts.fixed(make_writable(ctx.market_account))
      .fixed(make_readonly(ctx.admin_account, true));
  return finish(ctx, accounts, perp::schema::change_k_t{.factor = factor});
}

build_result_t assembler::close_account(
    const market_context_t& ctx,
    const perp::schema::public_key_t& user_account,
    const perp::schema::public_key_t& user_account_owner,
    const perp::schema::public_key_t& lamports_target) const {
  auto accounts = account_list_builder{3};
  accounts.fixed(make_writable(user_account))
      .fixed(make_readonly(user_account_owner, true))
      .fixed(make_writable(lamports_target));
  return finish(ctx, accounts, perp::schema::close_account_t{});
}

build_result_t assembler::add_page(
    const market_context_t& ctx,
    const uint8_t instance_index,
    const perp::schema::public_key_t& new_memory_page) const {
  auto instance = find_instance(ctx, instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::add_page, ctx,
                            instance_index);
  }

  // The engine only reads the new page's header here; it becomes writable
  // once it is part of the instance's page list.
  auto accounts = account_list_builder{4};
  accounts.fixed(make_readonly(ctx.market_account))
      .fixed(make_readonly(ctx.admin_account, true))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_readonly(new_memory_page));
  return finish(ctx, accounts,
                perp::schema::add_page_t{.instance_index = instance_index});
}

build_result_t assembler::rebalance(
    const market_context_t& ctx,
    const perp::schema::public_key_t& user_account,
    const perp::schema::public_key_t& user_account_owner,
    const uint8_t instance_index,
    const uint64_t collateral) const {
  auto instance = find_instance(ctx, instance_index);
  if (instance == nullptr) {
    return invalid_instance(perp::schema::instruction_tag_t::rebalance, ctx,
                            instance_index);
  }

  auto accounts = account_list_builder{10 + instance->memory_pages.size()};
  accounts.fixed(make_readonly(accounts_.token_program))
      .fixed(make_readonly(accounts_.clock_sysvar))
      .fixed(make_writable(ctx.market_account))
      .fixed(make_writable(instance->instance_account))
      .fixed(make_readonly(ctx.market_signer_account))
      .fixed(make_writable(ctx.market_vault))
      .fixed(make_writable(ctx.fee_sink))
      .fixed(make_readonly(user_account_owner, true))
      .fixed(make_writable(user_account))
      .fixed(make_readonly(ctx.admin_account, true))
      .pages(instance->memory_pages);
  return finish(ctx, accounts,
                perp::schema::rebalance_t{.collateral = collateral,
                                          .instance_index = instance_index});
}

build_result_t assembler::transfer_user_account(
    const market_context_t& ctx,
    const perp::schema::public_key_t& user_account,
    const perp::schema::public_key_t& user_account_owner,
    const perp::schema::public_key_t& new_user_account_owner) const {
  auto accounts = account_list_builder{3};
  accounts.fixed(make_readonly(user_account_owner, true))
      .fixed(make_writable(user_account))
      .fixed(make_readonly(new_user_account_owner));
  return finish(ctx, accounts, perp::schema::transfer_user_account_t{});
}

build_result_t assembler::transfer_position(
    const market_context_t& ctx,
    const uint16_t position_index,
    const perp::schema::public_key_t& source_user_account,
    const perp::schema::public_key_t& source_user_account_owner,
    const perp::schema::public_key_t& destination_user_account,
    const perp::schema::public_key_t& destination_user_account_owner) const {
  auto accounts = account_list_builder{4};
  accounts.fixed(make_readonly(source_user_account_owner, true))
      .fixed(make_writable(source_user_account))
      .fixed(make_readonly(destination_user_account_owner, true))
      .fixed(make_writable(destination_user_account));
  return finish(
      ctx, accounts,
      perp::schema::transfer_position_t{.position_index = position_index});
}

build_result_t assembler::finish(
    const market_context_t& ctx,
    account_list_builder& accounts,
    const perp::schema::instruction_payload_t& payload) const {
  auto tag = perp::schema::tag_of(payload);
  auto result = build_result_t{};

  auto list = accounts.finish();
  if (!list) {
    result.code = accounts.code();
    result.info = accounts.info();
    spdlog::warn("Rejected {} request: {} ({})", perp::schema::to_string(tag),
                 to_string(result.code), result.info);
    return result;
  }

  auto data = encoder_.try_encode(payload);
  if (!data) {
    result.code = request_error_code::encoding_error;
    result.info = "payload cannot be represented on the wire";
    spdlog::warn("Rejected {} request: {} ({})", perp::schema::to_string(tag),
                 to_string(result.code), result.info);
    return result;
  }

  spdlog::debug("Built {} request with {} accounts and {} payload bytes",
                perp::schema::to_string(tag), list->size(), data->size());
  result.request = request_t{.program_id = ctx.program_id,
                             .accounts = std::move(*list),
                             .data = std::move(*data)};
  return result;
}

build_result_t assembler::invalid_instance(
    const perp::schema::instruction_tag_t tag,
    const market_context_t& ctx,
    const uint8_t instance_index) const {
  auto result = build_result_t{
      .code = request_error_code::invalid_instance_index,
      .info = fmt::format("instance index {} out of range, market has {}",
                          instance_index, ctx.instances.size())};
  spdlog::warn("Rejected {} request: {} ({})", perp::schema::to_string(tag),
               to_string(result.code), result.info);
  return result;
}

}  // namespace perp::request

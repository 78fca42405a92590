#pragma once
#include <perp/schema/add_budget.hpp>
#include <perp/schema/add_instance.hpp>
#include <perp/schema/add_page.hpp>
#include <perp/schema/change_k.hpp>
#include <perp/schema/close_account.hpp>
#include <perp/schema/close_position.hpp>
#include <perp/schema/collect_garbage.hpp>
#include <perp/schema/crank_funding.hpp>
#include <perp/schema/crank_liquidation.hpp>
#include <perp/schema/create_market.hpp>
#include <perp/schema/enum_string.hpp>
#include <perp/schema/funding_extraction.hpp>
#include <perp/schema/increase_position.hpp>
#include <perp/schema/open_position.hpp>
#include <perp/schema/rebalance.hpp>
#include <perp/schema/transfer_position.hpp>
#include <perp/schema/transfer_user_account.hpp>
#include <perp/schema/update_oracle_account.hpp>
#include <perp/schema/withdraw_budget.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

// Schema type: instruction.
// The closed set of operations understood by the execution engine. The
// variant index is the discriminant byte on the wire, so alternatives may
// only ever be appended.
namespace perp::schema {

using instruction_payload_t = std::variant<create_market_t,
                                           add_instance_t,
                                           update_oracle_account_t,
                                           open_position_t,
                                           add_budget_t,
                                           withdraw_budget_t,
                                           increase_position_t,
                                           close_position_t,
                                           collect_garbage_t,
                                           crank_liquidation_t,
                                           crank_funding_t,
                                           funding_extraction_t,
                                           change_k_t,
                                           close_account_t,
                                           add_page_t,
                                           rebalance_t,
                                           transfer_user_account_t,
                                           transfer_position_t>;

enum class instruction_tag_t : uint8_t {
  create_market = 0,
  add_instance = 1,
  update_oracle_account = 2,
  open_position = 3,
  add_budget = 4,
  withdraw_budget = 5,
  increase_position = 6,
  close_position = 7,
  collect_garbage = 8,
  crank_liquidation = 9,
  crank_funding = 10,
  funding_extraction = 11,
  change_k = 12,
  close_account = 13,
  add_page = 14,
  rebalance = 15,
  transfer_user_account = 16,
  transfer_position = 17
};

inline constexpr auto kInstructionCount =
    std::variant_size_v<instruction_payload_t>;

static_assert(kInstructionCount == 18);
static_assert(
    std::is_same_v<std::variant_alternative_t<
                       static_cast<std::size_t>(instruction_tag_t::open_position),
                       instruction_payload_t>,
                   open_position_t>);
static_assert(std::is_same_v<
              std::variant_alternative_t<
                  static_cast<std::size_t>(instruction_tag_t::collect_garbage),
                  instruction_payload_t>,
              collect_garbage_t>);
static_assert(std::is_same_v<
              std::variant_alternative_t<
                  static_cast<std::size_t>(instruction_tag_t::transfer_position),
                  instruction_payload_t>,
              transfer_position_t>);

inline constexpr auto kInstructionTagMappings = std::array{
    std::pair<std::string_view, instruction_tag_t>{
        "create_market", instruction_tag_t::create_market},
    std::pair<std::string_view, instruction_tag_t>{
        "add_instance", instruction_tag_t::add_instance},
    std::pair<std::string_view, instruction_tag_t>{
        "update_oracle_account", instruction_tag_t::update_oracle_account},
    std::pair<std::string_view, instruction_tag_t>{
        "open_position", instruction_tag_t::open_position},
    std::pair<std::string_view, instruction_tag_t>{
        "add_budget", instruction_tag_t::add_budget},
    std::pair<std::string_view, instruction_tag_t>{
        "withdraw_budget", instruction_tag_t::withdraw_budget},
    std::pair<std::string_view, instruction_tag_t>{
        "increase_position", instruction_tag_t::increase_position},
    std::pair<std::string_view, instruction_tag_t>{
        "close_position", instruction_tag_t::close_position},
    std::pair<std::string_view, instruction_tag_t>{
        "collect_garbage", instruction_tag_t::collect_garbage},
    std::pair<std::string_view, instruction_tag_t>{
        "crank_liquidation", instruction_tag_t::crank_liquidation},
    std::pair<std::string_view, instruction_tag_t>{
        "crank_funding", instruction_tag_t::crank_funding},
    std::pair<std::string_view, instruction_tag_t>{
        "funding_extraction", instruction_tag_t::funding_extraction},
    std::pair<std::string_view, instruction_tag_t>{
        "change_k", instruction_tag_t::change_k},
    std::pair<std::string_view, instruction_tag_t>{
        "close_account", instruction_tag_t::close_account},
    std::pair<std::string_view, instruction_tag_t>{
        "add_page", instruction_tag_t::add_page},
    std::pair<std::string_view, instruction_tag_t>{
        "rebalance", instruction_tag_t::rebalance},
    std::pair<std::string_view, instruction_tag_t>{
        "transfer_user_account", instruction_tag_t::transfer_user_account},
    std::pair<std::string_view, instruction_tag_t>{
        "transfer_position", instruction_tag_t::transfer_position}};

static_assert(kInstructionTagMappings.size() == kInstructionCount);

template <>
inline std::optional<instruction_tag_t> try_from_string<instruction_tag_t>(
    const std::string_view value) {
  return from_string(value, kInstructionTagMappings);
}

inline constexpr std::string_view to_string(const instruction_tag_t value) {
  return to_string(value, kInstructionTagMappings).value_or("unknown");
}

inline instruction_tag_t tag_of(
    const instruction_payload_t& payload) {
  return static_cast<instruction_tag_t>(payload.index());
}

}  // namespace perp::schema

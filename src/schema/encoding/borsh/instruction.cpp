#include <perp/schema/encoding/borsh/instruction.hpp>

#include <utility>
#include <variant>

using namespace perp::schema;

namespace perp::schema::encoding::borsh {

namespace {

template <typename T>
void decode_alternative(instruction_payload_t& o, reader& in) {
  auto value = T{};
  decode(value, in);
  if (in.good()) {
    o = std::move(value);
  }
}

}  // namespace

void encode(const instruction_payload_t& o, writer& out) {
  out.write(static_cast<uint8_t>(tag_of(o)));
  std::visit([&out](const auto& operation) { encode(operation, out); }, o);
}

void decode(instruction_payload_t& o, reader& in) {
  auto tag = uint8_t{};
  in.read(tag);
  if (!in.good()) {
    return;
  }
  switch (static_cast<instruction_tag_t>(tag)) {
    case instruction_tag_t::create_market:
      return decode_alternative<create_market_t>(o, in);
    case instruction_tag_t::add_instance:
      return decode_alternative<add_instance_t>(o, in);
    case instruction_tag_t::update_oracle_account:
      return decode_alternative<update_oracle_account_t>(o, in);
    case instruction_tag_t::open_position:
      return decode_alternative<open_position_t>(o, in);
    case instruction_tag_t::add_budget:
      return decode_alternative<add_budget_t>(o, in);
    case instruction_tag_t::withdraw_budget:
      return decode_alternative<withdraw_budget_t>(o, in);
    case instruction_tag_t::increase_position:
      return decode_alternative<increase_position_t>(o, in);
    case instruction_tag_t::close_position:
      return decode_alternative<close_position_t>(o, in);
    case instruction_tag_t::collect_garbage:
      return decode_alternative<collect_garbage_t>(o, in);
    case instruction_tag_t::crank_liquidation:
      return decode_alternative<crank_liquidation_t>(o, in);
    case instruction_tag_t::crank_funding:
      return decode_alternative<crank_funding_t>(o, in);
    case instruction_tag_t::funding_extraction:
      return decode_alternative<funding_extraction_t>(o, in);
    case instruction_tag_t::change_k:
      return decode_alternative<change_k_t>(o, in);
    case instruction_tag_t::close_account:
      return decode_alternative<close_account_t>(o, in);
    case instruction_tag_t::add_page:
      return decode_alternative<add_page_t>(o, in);
    case instruction_tag_t::rebalance:
      return decode_alternative<rebalance_t>(o, in);
    case instruction_tag_t::transfer_user_account:
      return decode_alternative<transfer_user_account_t>(o, in);
    case instruction_tag_t::transfer_position:
      return decode_alternative<transfer_position_t>(o, in);
  }
  // Discriminant past the last known operation.
  in.fail();
}

}  // namespace perp::schema::encoding::borsh

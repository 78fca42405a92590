#include <perp/schema/encoding/borsh/account.hpp>

using namespace perp::schema;

namespace perp::schema::encoding::borsh {

void encode(const add_budget_t& o, writer& out) {
  out.write(o.amount);
}

void decode(add_budget_t& o, reader& in) {
  in.read(o.amount);
}

void encode(const withdraw_budget_t& o, writer& out) {
  out.write(o.amount);
}

void decode(withdraw_budget_t& o, reader& in) {
  in.read(o.amount);
}

void encode(const close_account_t&, writer&) {}

void decode(close_account_t&, reader&) {}

void encode(const transfer_user_account_t&, writer&) {}

void decode(transfer_user_account_t&, reader&) {}

}  // namespace perp::schema::encoding::borsh

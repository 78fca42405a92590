#pragma once
#include <perp/schema/add_budget.hpp>
#include <perp/schema/close_account.hpp>
#include <perp/schema/encoding/borsh/reader.hpp>
#include <perp/schema/encoding/borsh/writer.hpp>
#include <perp/schema/transfer_user_account.hpp>
#include <perp/schema/withdraw_budget.hpp>

namespace perp::schema::encoding::borsh {

void encode(const add_budget_t& o, writer& out);
void decode(add_budget_t& o, reader& in);

void encode(const withdraw_budget_t& o, writer& out);
void decode(withdraw_budget_t& o, reader& in);

void encode(const close_account_t& o, writer& out);
void decode(close_account_t& o, reader& in);

void encode(const transfer_user_account_t& o, writer& out);
void decode(transfer_user_account_t& o, reader& in);

}  // namespace perp::schema::encoding::borsh

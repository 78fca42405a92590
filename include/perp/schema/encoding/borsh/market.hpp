#pragma once
#include <perp/schema/add_instance.hpp>
#include <perp/schema/add_page.hpp>
#include <perp/schema/change_k.hpp>
#include <perp/schema/create_market.hpp>
#include <perp/schema/encoding/borsh/reader.hpp>
#include <perp/schema/encoding/borsh/writer.hpp>
#include <perp/schema/update_oracle_account.hpp>

namespace perp::schema::encoding::borsh {

void encode(const create_market_t& o, writer& out);
void decode(create_market_t& o, reader& in);

void encode(const add_instance_t& o, writer& out);
void decode(add_instance_t& o, reader& in);

void encode(const update_oracle_account_t& o, writer& out);
void decode(update_oracle_account_t& o, reader& in);

void encode(const change_k_t& o, writer& out);
void decode(change_k_t& o, reader& in);

void encode(const add_page_t& o, writer& out);
void decode(add_page_t& o, reader& in);

}  // namespace perp::schema::encoding::borsh

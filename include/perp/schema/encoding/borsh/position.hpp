#pragma once
#include <perp/schema/close_position.hpp>
#include <perp/schema/encoding/borsh/reader.hpp>
#include <perp/schema/encoding/borsh/writer.hpp>
#include <perp/schema/increase_position.hpp>
#include <perp/schema/open_position.hpp>
#include <perp/schema/position_side.hpp>
#include <perp/schema/rebalance.hpp>
#include <perp/schema/transfer_position.hpp>

namespace perp::schema::encoding::borsh {

void encode(const position_side_t& o, writer& out);
void decode(position_side_t& o, reader& in);

void encode(const open_position_t& o, writer& out);
void decode(open_position_t& o, reader& in);

void encode(const increase_position_t& o, writer& out);
void decode(increase_position_t& o, reader& in);

void encode(const close_position_t& o, writer& out);
void decode(close_position_t& o, reader& in);

void encode(const rebalance_t& o, writer& out);
void decode(rebalance_t& o, reader& in);

void encode(const transfer_position_t& o, writer& out);
void decode(transfer_position_t& o, reader& in);

}  // namespace perp::schema::encoding::borsh

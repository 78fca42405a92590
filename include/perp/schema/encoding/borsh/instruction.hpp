#pragma once
#include <perp/schema/encoding/borsh/account.hpp>
#include <perp/schema/encoding/borsh/crank.hpp>
#include <perp/schema/encoding/borsh/market.hpp>
#include <perp/schema/encoding/borsh/position.hpp>
#include <perp/schema/instruction.hpp>

namespace perp::schema::encoding::borsh {

// One discriminant byte followed by the fields of the selected operation.
void encode(const instruction_payload_t& o, writer& out);
void decode(instruction_payload_t& o, reader& in);

}  // namespace perp::schema::encoding::borsh

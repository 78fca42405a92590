#pragma once
#include <perp/schema/collect_garbage.hpp>
#include <perp/schema/crank_funding.hpp>
#include <perp/schema/crank_liquidation.hpp>
#include <perp/schema/encoding/borsh/reader.hpp>
#include <perp/schema/encoding/borsh/writer.hpp>
#include <perp/schema/funding_extraction.hpp>

namespace perp::schema::encoding::borsh {

void encode(const collect_garbage_t& o, writer& out);
void decode(collect_garbage_t& o, reader& in);

void encode(const crank_liquidation_t& o, writer& out);
void decode(crank_liquidation_t& o, reader& in);

void encode(const crank_funding_t& o, writer& out);
void decode(crank_funding_t& o, reader& in);

void encode(const funding_extraction_t& o, writer& out);
void decode(funding_extraction_t& o, reader& in);

}  // namespace perp::schema::encoding::borsh

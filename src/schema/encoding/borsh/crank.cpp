#include <perp/schema/encoding/borsh/crank.hpp>

using namespace perp::schema;

namespace perp::schema::encoding::borsh {

void encode(const collect_garbage_t& o, writer& out) {
  out.write(o.instance_index);
  out.write(o.max_iterations);
}

void decode(collect_garbage_t& o, reader& in) {
  in.read(o.instance_index);
  in.read(o.max_iterations);
}

void encode(const crank_liquidation_t& o, writer& out) {
  out.write(o.instance_index);
}

void decode(crank_liquidation_t& o, reader& in) {
  in.read(o.instance_index);
}

void encode(const crank_funding_t&, writer&) {}

void decode(crank_funding_t&, reader&) {}

void encode(const funding_extraction_t& o, writer& out) {
  out.write(o.instance_index);
}

void decode(funding_extraction_t& o, reader& in) {
  in.read(o.instance_index);
}

}  // namespace perp::schema::encoding::borsh

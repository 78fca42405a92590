#include <perp/schema/encoding/borsh/market.hpp>

using namespace perp::schema;

namespace perp::schema::encoding::borsh {

void encode(const create_market_t& o, writer& out) {
  out.write(o.signer_nonce);
  out.write(o.market_symbol);
  out.write(o.initial_v_quote_amount);
  out.write(o.coin_decimals);
  out.write(o.quote_decimals);
}

void decode(create_market_t& o, reader& in) {
  in.read(o.signer_nonce);
  in.read(o.market_symbol);
  in.read(o.initial_v_quote_amount);
  in.read(o.coin_decimals);
  in.read(o.quote_decimals);
}

void encode(const add_instance_t&, writer&) {}

void decode(add_instance_t&, reader&) {}

void encode(const update_oracle_account_t&, writer&) {}

void decode(update_oracle_account_t&, reader&) {}

void encode(const change_k_t& o, writer& out) {
  out.write(o.factor);
}

void decode(change_k_t& o, reader& in) {
  in.read(o.factor);
}

void encode(const add_page_t& o, writer& out) {
  out.write(o.instance_index);
}

void decode(add_page_t& o, reader& in) {
  in.read(o.instance_index);
}

}  // namespace perp::schema::encoding::borsh

#include <perp/schema/encoding/borsh/position.hpp>

using namespace perp::schema;

namespace perp::schema::encoding::borsh {

void encode(const position_side_t& o, writer& out) {
  out.write(static_cast<uint8_t>(o));
}

void decode(position_side_t& o, reader& in) {
  auto value = uint8_t{};
  in.read(value);
  if (!in.good()) {
    return;
  }
  if (value > static_cast<uint8_t>(position_side_t::long_position)) {
    in.fail();
    return;
  }
  o = static_cast<position_side_t>(value);
}

void encode(const open_position_t& o, writer& out) {
  encode(o.side, out);
  out.write(o.collateral);
  out.write(o.instance_index);
  out.write(o.leverage);
  out.write(o.predicted_entry_price);
  out.write(o.maximum_slippage_margin);
}

void decode(open_position_t& o, reader& in) {
  decode(o.side, in);
  in.read(o.collateral);
  in.read(o.instance_index);
  in.read(o.leverage);
  in.read(o.predicted_entry_price);
  in.read(o.maximum_slippage_margin);
}

void encode(const increase_position_t& o, writer& out) {
  out.write(o.add_collateral);
  out.write(o.instance_index);
  out.write(o.leverage);
  out.write(o.position_index);
  out.write(o.predicted_entry_price);
  out.write(o.maximum_slippage_margin);
}

void decode(increase_position_t& o, reader& in) {
  in.read(o.add_collateral);
  in.read(o.instance_index);
  in.read(o.leverage);
  in.read(o.position_index);
  in.read(o.predicted_entry_price);
  in.read(o.maximum_slippage_margin);
}

void encode(const close_position_t& o, writer& out) {
  out.write(o.position_index);
  out.write(o.closing_collateral);
  out.write(o.closing_v_coin);
  out.write(o.predicted_entry_price);
  out.write(o.maximum_slippage_margin);
}

void decode(close_position_t& o, reader& in) {
  in.read(o.position_index);
  in.read(o.closing_collateral);
  in.read(o.closing_v_coin);
  in.read(o.predicted_entry_price);
  in.read(o.maximum_slippage_margin);
}

void encode(const rebalance_t& o, writer& out) {
  out.write(o.collateral);
  out.write(o.instance_index);
}

void decode(rebalance_t& o, reader& in) {
  in.read(o.collateral);
  in.read(o.instance_index);
}

void encode(const transfer_position_t& o, writer& out) {
  out.write(o.position_index);
}

void decode(transfer_position_t& o, reader& in) {
  in.read(o.position_index);
}

}  // namespace perp::schema::encoding::borsh

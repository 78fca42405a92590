#pragma once
#include <cstdint>
#include <string>

// Schema type: create market.
// Creates a market around one coin; the engine seeds the vAMM with the
// initial virtual quote amount.
namespace perp::schema {

template <uint16_t Version>
struct create_market;

template <>
struct create_market<1> final {
  uint8_t signer_nonce{};
  std::string market_symbol;
  uint64_t initial_v_quote_amount{};
  uint8_t coin_decimals{};
  uint8_t quote_decimals{};

  bool operator==(const create_market&) const = default;
};

using create_market_t = create_market<1>;

}  // namespace perp::schema

#pragma once
#include <perp/common/critical.hpp>
#include <perp/schema/encoding/borsh/account.hpp>
#include <perp/schema/encoding/borsh/crank.hpp>
#include <perp/schema/encoding/borsh/instruction.hpp>
#include <perp/schema/encoding/borsh/market.hpp>
#include <perp/schema/encoding/borsh/position.hpp>
#include <perp/schema/encoding/borsh/reader.hpp>
#include <perp/schema/encoding/borsh/writer.hpp>
#include <perp/schema/encoding/encoder.hpp>
#include <iterator>
#include <utility>

namespace perp::schema::encoding {

struct borsh_encoder_tag {};

template <>
struct encoder<borsh_encoder_tag> final {
  template <typename T>
  perp::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, perp::schema::bytes_t& out);

  template <typename T>
  std::optional<perp::schema::bytes_t> try_encode(const T& obj);

  template <typename T>
  T decode(const perp::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const perp::schema::bytes_view_t& bytes);
};

template <typename T>
std::optional<perp::schema::bytes_t> encoder<borsh_encoder_tag>::try_encode(
    const T& obj) {
  auto out = borsh::writer{};
  borsh::encode(obj, out);
  if (!out.good()) {
    return std::nullopt;
  }
  return std::move(out.data);
}

template <typename T>
perp::schema::bytes_t encoder<borsh_encoder_tag>::encode(const T& obj) {
  auto encoded = try_encode(obj);
  if (!encoded) {
    perp::common::critical("failed to encode borsh object");
  }
  return std::move(encoded.value());
}

template <typename T>
void encoder<borsh_encoder_tag>::encode(const T& obj,
                                        perp::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

// Trailing bytes are rejected: a payload must be consumed exactly.
template <typename T>
std::optional<T> encoder<borsh_encoder_tag>::try_decode(
    const perp::schema::bytes_view_t& bytes) {
  auto value = T{};
  auto in = borsh::reader{.data = bytes};
  borsh::decode(value, in);
  if (!in.good() || !in.exhausted()) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
T encoder<borsh_encoder_tag>::decode(const perp::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    perp::common::critical("failed to decode borsh bytes");
  }
  return std::move(decoded.value());
}

}  // namespace perp::schema::encoding

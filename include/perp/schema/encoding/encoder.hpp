#pragma once
#include <perp/schema/primitives.hpp>
#include <optional>
#include <span>

namespace perp::schema::encoding {

// The wire codec is a build time setting selected by tag type, e.g.
// encoder<borsh_encoder_tag>. Callers only ever see this surface, so the
// layout library can change without touching the request assembler.
//
// `encode`/`decode` treat failure as fatal. The `try_` variants report it
// through std::nullopt and are what library code uses.
template <typename Library>
struct encoder {
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

}  // namespace perp::schema::encoding

#pragma once
#include <perp/request/account_meta.hpp>
#include <perp/schema/primitives.hpp>
#include <vector>

namespace perp::request {

/// Unsigned request handed to the transport layer: the engine program,
/// its ordered accounts and the encoded payload.
struct request final {
  perp::schema::public_key_t program_id{};
  std::vector<account_meta_t> accounts;
  perp::schema::bytes_t data;

  bool operator==(const request&) const = default;
};

using request_t = request;

}  // namespace perp::request

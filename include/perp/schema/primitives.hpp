#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace perp::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using public_key_t = std::array<uint8_t, 32>;

std::string to_hex(const bytes_view_t& bytes);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);

// Account identities are written in base58 (Bitcoin alphabet).
std::string to_base58(const public_key_t& key);
std::optional<public_key_t> try_make_public_key(std::string_view base58);
public_key_t make_public_key(std::string_view base58);
public_key_t make_zero_public_key();
bool is_zero(const public_key_t& key);

}  // namespace perp::schema

#pragma once

#include <perp/request/account_meta.hpp>
#include <perp/request/market_context.hpp>
#include <perp/schema/primitives.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace perp::testing {

inline perp::schema::bytes_t make_bytes(const std::string_view text) {
  return perp::schema::bytes_t{std::begin(text), std::end(text)};
}

inline std::optional<perp::schema::bytes_t> try_from_hex(
    std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto nibble = [](const char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  };
  auto out = perp::schema::bytes_t{};
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = nibble(hex[i]);
    auto low = nibble(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

inline perp::schema::bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    ADD_FAILURE() << "invalid hex fixture: " << hex;
    return {};
  }
  return *decoded;
}

inline perp::schema::public_key_t make_key(const uint8_t seed) {
  auto out = perp::schema::public_key_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::vector<perp::schema::public_key_t> make_pages(
    const uint8_t first_seed,
    const std::size_t count) {
  auto pages = std::vector<perp::schema::public_key_t>{};
  for (std::size_t i = 0; i < count; ++i) {
    pages.push_back(make_key(static_cast<uint8_t>(first_seed + i)));
  }
  return pages;
}

// Seeds 1..7 are the market's own accounts; instance n uses seed 20 + 10n
// for its account and the following seeds for its pages.
inline perp::request::market_context_t make_market_context(
    const std::vector<std::size_t>& pages_per_instance = {2}) {
  auto ctx = perp::request::market_context_t{.program_id = make_key(1),
                                             .signer_nonce = 254,
                                             .market_signer_account =
                                                 make_key(2),
                                             .oracle_account = make_key(3),
                                             .market_account = make_key(4),
                                             .admin_account = make_key(5),
                                             .market_vault = make_key(6),
                                             .fee_sink = make_key(7)};
  for (std::size_t i = 0; i < pages_per_instance.size(); ++i) {
    auto seed = static_cast<uint8_t>(20 + (10 * i));
    ctx.instances.push_back(perp::request::instance_context_t{
        .instance_account = make_key(seed),
        .memory_pages =
            make_pages(static_cast<uint8_t>(seed + 1), pages_per_instance[i])});
  }
  return ctx;
}

inline perp::request::account_meta_t writable(
    const perp::schema::public_key_t& key,
    const bool is_signer = false) {
  return perp::request::make_writable(key, is_signer);
}

inline perp::request::account_meta_t readonly(
    const perp::schema::public_key_t& key,
    const bool is_signer = false) {
  return perp::request::make_readonly(key, is_signer);
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace perp::testing

#include <perp/common/critical.hpp>
#include <perp/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace perp::schema {

namespace {

constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

// 32 bytes never need more than 44 base58 digits.
constexpr auto kMaxBase58KeyLength = std::size_t{44};

std::optional<uint8_t> base58_digit(const char c) {
  auto position = kBase58Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

std::string to_base58(const public_key_t& key) {
  auto leading_zeros = static_cast<std::size_t>(std::distance(
      std::begin(key),
      std::find_if(std::begin(key), std::end(key),
                   [](const uint8_t byte) { return byte != 0; })));

  // Little-endian base58 digits.
  auto digits = std::vector<uint8_t>{};
  digits.reserve(kMaxBase58KeyLength);
  for (auto i = leading_zeros; i < key.size(); ++i) {
    auto carry = static_cast<uint32_t>(key[i]);
    for (auto& digit : digits) {
      carry += static_cast<uint32_t>(digit) << 8u;
      digit = static_cast<uint8_t>(carry % 58u);
      carry /= 58u;
    }
    while (carry > 0) {
      digits.push_back(static_cast<uint8_t>(carry % 58u));
      carry /= 58u;
    }
  }

  auto out = std::string(leading_zeros, '1');
  out.reserve(leading_zeros + digits.size());
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::optional<public_key_t> try_make_public_key(const std::string_view base58) {
  if (base58.empty() || base58.size() > kMaxBase58KeyLength) {
    return std::nullopt;
  }

  auto leading_zeros = std::size_t{0};
  while (leading_zeros < base58.size() && base58[leading_zeros] == '1') {
    ++leading_zeros;
  }

  // Big-endian base256 accumulator.
  auto decoded = bytes_t{};
  decoded.reserve(sizeof(public_key_t));
  for (const auto ch : base58) {
    auto digit = base58_digit(ch);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    for (auto it = decoded.rbegin(); it != decoded.rend(); ++it) {
      carry += static_cast<uint32_t>(*it) * 58u;
      *it = static_cast<uint8_t>(carry & 0xFFu);
      carry >>= 8u;
    }
    while (carry > 0) {
      decoded.insert(std::begin(decoded), static_cast<uint8_t>(carry & 0xFFu));
      carry >>= 8u;
    }
  }

  auto key = public_key_t{};
  if ((leading_zeros + decoded.size()) != key.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(decoded), std::end(decoded),
            std::begin(key) + static_cast<std::ptrdiff_t>(leading_zeros));
  return key;
}

public_key_t make_public_key(const std::string_view base58) {
  auto key = try_make_public_key(base58);
  if (!key.has_value()) {
    perp::common::critical("invalid base58 public key");
  }
  return *key;
}

public_key_t make_zero_public_key() {
  return {};
}

bool is_zero(const public_key_t& key) {
  return std::all_of(std::begin(key), std::end(key),
                     [](const uint8_t byte) { return byte == 0; });
}

}  // namespace perp::schema

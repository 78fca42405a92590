#pragma once
#include <perp/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <limits>
#include <string_view>
#include <type_traits>

namespace perp::schema::encoding::borsh {

/// Largest byte length a string's u32 length prefix can describe.
inline constexpr auto kMaxStringLength =
    static_cast<std::size_t>(std::numeric_limits<uint32_t>::max());

constexpr bool fits_length_prefix(const std::size_t length) {
  return length <= kMaxStringLength;
}

/// Appends Borsh-layout fields: fixed-width little-endian integers and
/// u32-length-prefixed strings. A string that does not fit its prefix
/// marks the writer as overflowed; nothing after it is written.
struct writer final {
  perp::schema::bytes_t data;
  bool overflow{false};

  writer& write(const std::string_view& str);

  template <typename T,
            typename = std::enable_if_t<std::is_integral_v<T> &&
                                        !std::is_same_v<T, bool>>>
  writer& write(T value) {
    if (overflow) {
      return *this;
    }
    auto little = boost::endian::native_to_little(value);
    auto bytes = std::array<uint8_t, sizeof(T)>{};
    std::memcpy(bytes.data(), &little, sizeof(T));
    data.insert(std::end(data), std::begin(bytes), std::end(bytes));
    return *this;
  }

  bool good() const { return !overflow; }
};

}  // namespace perp::schema::encoding::borsh

#pragma once
#include <perp/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>

namespace perp::schema::encoding::borsh {

/// Consumes Borsh-layout fields from a byte view. Any short read or
/// invalid value latches `failed`; later reads are no-ops.
struct reader final {
  perp::schema::bytes_view_t data;
  std::size_t offset{};
  bool failed{false};

  reader& read(std::string& str);

  template <typename T,
            typename = std::enable_if_t<std::is_integral_v<T> &&
                                        !std::is_same_v<T, bool>>>
  reader& read(T& value) {
    if (failed || remaining() < sizeof(T)) {
      failed = true;
      return *this;
    }
    auto little = T{};
    std::memcpy(&little, data.data() + offset, sizeof(T));
    value = boost::endian::little_to_native(little);
    offset += sizeof(T);
    return *this;
  }

  void fail() { failed = true; }
  std::size_t remaining() const { return data.size() - offset; }
  bool exhausted() const { return remaining() == 0; }
  bool good() const { return !failed; }
};

}  // namespace perp::schema::encoding::borsh

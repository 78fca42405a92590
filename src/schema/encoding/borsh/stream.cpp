#include <perp/schema/encoding/borsh/reader.hpp>
#include <perp/schema/encoding/borsh/writer.hpp>

#include <algorithm>
#include <iterator>

namespace perp::schema::encoding::borsh {

writer& writer::write(const std::string_view& str) {
  if (overflow) {
    return *this;
  }
  if (!fits_length_prefix(str.size())) {
    overflow = true;
    return *this;
  }
  write(static_cast<uint32_t>(str.size()));
  std::ranges::copy_n(str.data(), static_cast<std::ptrdiff_t>(str.size()),
                      std::back_inserter(data));
  return *this;
}

reader& reader::read(std::string& str) {
  auto length = uint32_t{};
  read(length);
  if (failed) {
    return *this;
  }
  if (remaining() < length) {
    failed = true;
    return *this;
  }
  str.assign(reinterpret_cast<const char*>(data.data() + offset), length);
  offset += length;
  return *this;
}

}  // namespace perp::schema::encoding::borsh

#include "clonekit/byte_reader.hpp"

#include "clonekit/fs.hpp"

#include <string>

namespace clonekit {

void ByteReader::require(std::size_t n) const {
  if (n > remaining()) {
    throw Error(underflow_kind_, "unexpected end of stream at offset " + std::to_string(pos_) +
                                     " (need " + std::to_string(n) + " bytes, have " +
                                     std::to_string(remaining()) + ")");
  }
}

auto ByteReader::read_byte() -> std::uint8_t {
  require(1);
  return data_[pos_++];
}

auto ByteReader::read_bytes(std::size_t n) -> std::span<const std::uint8_t> {
  require(n);
  auto out = data_.subspan(pos_, n);
  pos_ += n;
  return out;
}

auto ByteReader::read_be32() -> std::uint32_t {
  const auto b = read_bytes(4);
  return (static_cast<std::uint32_t>(b[0]) << 24U) | (static_cast<std::uint32_t>(b[1]) << 16U) |
         (static_cast<std::uint32_t>(b[2]) << 8U) | static_cast<std::uint32_t>(b[3]);
}

auto ByteReader::inflate(std::size_t size_hint) -> std::vector<std::uint8_t> {
  auto res = fs::z_inflate_prefix(rest(), size_hint, underflow_kind_);
  last_inflate_ = res.consumed;
  pos_ += res.consumed;
  return std::move(res.data);
}

} // namespace clonekit

#include "clonekit/varint.hpp"

#include "clonekit/byte_reader.hpp"
#include "clonekit/error.hpp"

namespace clonekit::varint {

namespace {
constexpr std::uint8_t kContinue = 0x80;
constexpr unsigned kMaxShift = 63;
} // namespace

auto read_pack_entry_header(ByteReader &in) -> PackEntryHeader {
  PackEntryHeader out{};
  std::uint8_t byte = in.read_byte();
  out.consumed = 1;
  out.type = static_cast<std::uint8_t>((byte >> 4U) & 0x07U);
  out.size = byte & 0x0FU;

  unsigned shift = 4;
  while ((byte & kContinue) != 0) {
    if (shift > kMaxShift) {
      throw Error(ErrorKind::ProtocolError, "pack entry size does not fit in 64 bits");
    }
    byte = in.read_byte();
    ++out.consumed;
    out.size |= static_cast<std::uint64_t>(byte & 0x7FU) << shift;
    shift += 7;
  }
  return out;
}

auto read_delta_length(ByteReader &in) -> VarInt {
  VarInt out{};
  unsigned shift = 0;
  std::uint8_t byte = 0;
  do {
    if (shift > kMaxShift) {
      throw Error(ErrorKind::CorruptDelta, "delta length does not fit in 64 bits");
    }
    byte = in.read_byte();
    ++out.consumed;
    out.value |= static_cast<std::uint64_t>(byte & 0x7FU) << shift;
    shift += 7;
  } while ((byte & kContinue) != 0);
  return out;
}

} // namespace clonekit::varint

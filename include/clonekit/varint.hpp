#pragma once
#include <cstdint>

namespace clonekit {

class ByteReader; // fwd

// A decoded variable-length integer and how many input bytes it took.
struct VarInt {
  std::uint64_t value = 0;
  std::size_t consumed = 0;
};

namespace varint {

// Pack entry header byte sequence.
struct PackEntryHeader {
  std::uint8_t type = 0;   // bits 4-6 of the first byte
  std::uint64_t size = 0;  // inflated size of the entry payload
  std::size_t consumed = 0;
};

// First byte: bit 7 continue, bits 4-6 type, bits 0-3 low size bits.
// Continuation byte n (1-based) adds 7 bits at shift 4 + 7*(n-1).
auto read_pack_entry_header(ByteReader &in) -> PackEntryHeader;

// Delta source/target length: 7 bits per byte, little-endian groups,
// bit 7 continue.
auto read_delta_length(ByteReader &in) -> VarInt;

} // namespace varint

} // namespace clonekit

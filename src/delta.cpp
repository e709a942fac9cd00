#include "clonekit/delta.hpp"

#include "clonekit/byte_reader.hpp"
#include "clonekit/error.hpp"
#include "clonekit/varint.hpp"

#include <algorithm>
#include <string>

namespace clonekit::delta {

namespace {

constexpr std::uint8_t kCopyFlag = 0x80;
constexpr std::uint32_t kDefaultCopySize = 0x10000;

struct CopyOp {
  std::uint32_t offset = 0;
  std::uint32_t size = 0;
};

// Offset bytes are gated by bits 0-3, size bytes by bits 4-6; a clear bit
// leaves that byte zero and reads nothing.
CopyOp read_copy(ByteReader &in, std::uint8_t op) {
  CopyOp c{};
  for (unsigned i = 0; i < 4; ++i) {
    if ((op & (1U << i)) != 0) {
      c.offset |= static_cast<std::uint32_t>(in.read_byte()) << (8U * i);
    }
  }
  for (unsigned i = 0; i < 3; ++i) {
    if ((op & (1U << (4 + i))) != 0) {
      c.size |= static_cast<std::uint32_t>(in.read_byte()) << (8U * i);
    }
  }
  if (c.size == 0) {
    c.size = kDefaultCopySize;
  }
  return c;
}

[[noreturn]] void corrupt(const std::string &what) {
  throw Error(ErrorKind::CorruptDelta, "delta: " + what);
}

} // namespace

std::vector<std::uint8_t> apply(std::span<const std::uint8_t> base,
                                std::span<const std::uint8_t> delta) {
  ByteReader in{delta, ErrorKind::CorruptDelta};

  const auto source_len = varint::read_delta_length(in).value;
  const auto target_len = varint::read_delta_length(in).value;
  if (source_len != base.size()) {
    corrupt("source length " + std::to_string(source_len) + " does not match base size " +
            std::to_string(base.size()));
  }

  // target_len is untrusted input; cap the reservation.
  std::vector<std::uint8_t> out;
  out.reserve(static_cast<std::size_t>(
      std::min<std::uint64_t>(target_len, base.size() + delta.size())));

  while (!in.at_end()) {
    const std::uint8_t op = in.read_byte();
    if ((op & kCopyFlag) != 0) {
      const CopyOp c = read_copy(in, op);
      if (static_cast<std::uint64_t>(c.offset) + c.size > base.size()) {
        corrupt("copy [" + std::to_string(c.offset) + ", +" + std::to_string(c.size) +
                ") outside base of " + std::to_string(base.size()) + " bytes");
      }
      if (out.size() + c.size > target_len) {
        corrupt("copy overruns target length " + std::to_string(target_len));
      }
      out.insert(out.end(), base.begin() + c.offset, base.begin() + c.offset + c.size);
    } else if (op != 0) {
      const auto literal = in.read_bytes(op);
      if (out.size() + literal.size() > target_len) {
        corrupt("insert overruns target length " + std::to_string(target_len));
      }
      out.insert(out.end(), literal.begin(), literal.end());
    } else {
      corrupt("reserved opcode 0");
    }
  }

  if (out.size() != target_len) {
    corrupt("produced " + std::to_string(out.size()) + " bytes, expected " +
            std::to_string(target_len));
  }
  return out;
}

} // namespace clonekit::delta

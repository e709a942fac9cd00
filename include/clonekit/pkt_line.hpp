#pragma once
#include "clonekit/consts.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clonekit {

class ByteReader; // fwd

namespace pkt {

// One pkt-line: either a flush packet ("0000") or a payload.
struct Packet {
  bool flush = false;
  std::string payload; // without the 4-digit length prefix

  friend bool operator==(const Packet &, const Packet &) = default;
};

// "<4 hex length><payload>", the length counting its own 4 digits.
[[nodiscard]] auto encode(std::string_view payload) -> std::string;

[[nodiscard]] inline auto flush() -> std::string { return std::string(consts::kFlushPkt); }

// Read one packet at the cursor. Throws Error{ProtocolError} on a bad length
// prefix, a reserved length (0001-0003), or a truncated payload.
auto read_packet(ByteReader &in) -> Packet;

// Split a whole body into packets.
[[nodiscard]] auto split(std::span<const std::uint8_t> body) -> std::vector<Packet>;

// Drop one trailing '\n' from a payload, if present.
[[nodiscard]] auto chomp(std::string_view payload) -> std::string_view;

} // namespace pkt

} // namespace clonekit

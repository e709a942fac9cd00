#include "clonekit/pkt_line.hpp"

#include "clonekit/byte_reader.hpp"
#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>

namespace clonekit::pkt {

auto encode(std::string_view payload) -> std::string {
  const std::size_t len = payload.size() + consts::kPktLenDigits;
  if (len > consts::kPktMaxLen) {
    throw std::invalid_argument("pkt-line payload too long: " + std::to_string(payload.size()));
  }
  std::array<char, 8> prefix{};
  std::snprintf(prefix.data(), prefix.size(), "%04zx", len);
  std::string out(prefix.data(), consts::kPktLenDigits);
  out.append(payload);
  return out;
}

auto read_packet(ByteReader &in) -> Packet {
  const auto digits = in.read_bytes(consts::kPktLenDigits);
  std::size_t len = 0;
  for (const std::uint8_t c : digits) {
    int v = -1;
    if (c >= '0' && c <= '9') {
      v = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      v = 10 + (c - 'a');
    } else if (c >= 'A' && c <= 'F') {
      v = 10 + (c - 'A');
    }
    if (v < 0) {
      throw Error(ErrorKind::ProtocolError, "pkt-line: bad length prefix '" +
                                                std::string(digits.begin(), digits.end()) + "'");
    }
    len = (len << 4U) | static_cast<std::size_t>(v);
  }

  if (len == 0) {
    return Packet{.flush = true, .payload = {}};
  }
  if (len < consts::kPktLenDigits) {
    throw Error(ErrorKind::ProtocolError, "pkt-line: reserved length " + std::to_string(len));
  }
  const auto body = in.read_bytes(len - consts::kPktLenDigits);
  return Packet{.flush = false, .payload = std::string(body.begin(), body.end())};
}

auto split(std::span<const std::uint8_t> body) -> std::vector<Packet> {
  ByteReader in{body};
  std::vector<Packet> out;
  while (!in.at_end()) {
    out.push_back(read_packet(in));
  }
  return out;
}

auto chomp(std::string_view payload) -> std::string_view {
  if (!payload.empty() && payload.back() == consts::kLF) {
    payload.remove_suffix(1);
  }
  return payload;
}

} // namespace clonekit::pkt

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace clonekit {

enum class ErrorKind : std::uint8_t {
  NotFound,             // missing object, ref or HEAD
  CorruptObject,        // bad header, failed inflate, bad tree/commit body
  CorruptDelta,         // length mismatch or out-of-range copy in a delta
  ProtocolError,        // bad magic, malformed pkt-line, truncated stream
  UnsupportedPackEntry, // tag or offset-delta entries
  TransportError,       // HTTP request failed or returned a non-2xx status
};

[[nodiscard]] auto error_kind_name(ErrorKind kind) -> std::string_view;

// Every failure of the clone pipeline is terminal for the operation in
// progress; the kind tells the caller which stage gave up.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace clonekit

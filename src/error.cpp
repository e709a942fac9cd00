#include "clonekit/error.hpp"

namespace clonekit {

auto error_kind_name(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::CorruptObject:
    return "CorruptObject";
  case ErrorKind::CorruptDelta:
    return "CorruptDelta";
  case ErrorKind::ProtocolError:
    return "ProtocolError";
  case ErrorKind::UnsupportedPackEntry:
    return "UnsupportedPackEntry";
  case ErrorKind::TransportError:
    return "TransportError";
  }
  return "Unknown";
}

} // namespace clonekit

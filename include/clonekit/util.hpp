#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace clonekit {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// View the characters of a string as raw bytes (no copy).
inline auto as_bytes(std::string_view s) -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Strip leading and trailing spaces/tabs/CR
  auto trim(std::string_view sv) -> std::string;
}

}

#pragma once
#include "clonekit/consts.hpp"
#include "clonekit/hash.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clonekit {

class ObjectStore; // fwd

struct TreeEntry {
  std::uint32_t mode; // e.g., consts::kModeFile file, 040000 dir (octal)
  std::string name;   // filename (no '/')
  oid id;             // 20-byte raw SHA-1 of referenced object

  friend bool operator==(const TreeEntry &, const TreeEntry &) = default;
};

namespace tree {

// Parse a tree payload. Child ids are raw bytes and may contain NUL.
// Throws Error{CorruptObject} on truncated or malformed entries.
std::vector<TreeEntry> decode(std::span<const std::uint8_t> payload);

// Serialize entries in the order given (callers sort by name).
std::vector<std::uint8_t> encode(const std::vector<TreeEntry> &entries);

// Read `hex_oid` from the store and decode it; the object must be a tree.
std::vector<TreeEntry> read(const ObjectStore &store, std::string_view hex_oid);

auto mode_to_ascii_octal(std::uint32_t mode) -> std::string;
auto ascii_octal_to_mode(std::string_view str) -> std::uint32_t;

inline bool is_directory(std::uint32_t mode) { return mode == consts::kModeTree; }
inline bool is_executable(std::uint32_t mode) { return mode == consts::kModeExec; }

} // namespace tree

} // namespace clonekit

#pragma once
#include "clonekit/hash.hpp"
#include "clonekit/object.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace clonekit {

class ByteReader;  // fwd
class ObjectStore; // fwd

// Entry type tags as they appear in bits 4-6 of a pack entry header.
enum class PackEntryKind : std::uint8_t {
  Commit = 1,
  Tree = 2,
  Blob = 3,
  Tag = 4,
  OffsetDelta = 6,
  RefDelta = 7,
};

namespace pack {

struct Header {
  std::uint32_t version = 0;
  std::uint32_t count = 0;
};

struct Entry {
  PackEntryKind kind{};
  std::uint64_t declared_size = 0;
  std::optional<oid> base;         // set for RefDelta only
  std::vector<std::uint8_t> data;  // inflated payload
};

struct UnpackStats {
  std::uint32_t entries = 0;       // entries in the pack
  std::size_t objects = 0;         // objects written to the store
  std::size_t deltas = 0;          // of which reconstructed from ref-deltas
};

[[nodiscard]] auto entry_kind_name(PackEntryKind kind) -> std::string_view;

// Validate a raw 3-bit type tag; 0 and 5 are reserved.
[[nodiscard]] auto to_entry_kind(std::uint8_t type) -> PackEntryKind;

// The object kind a non-delta entry is stored as. Throws
// Error{UnsupportedPackEntry} for tag and offset-delta entries.
[[nodiscard]] auto to_object_kind(PackEntryKind kind) -> ObjectKind;

// "PACK", BE32 version (2 or 3), BE32 entry count.
auto read_header(ByteReader &in) -> Header;

// Read one entry (header, optional base id, inflated payload) and leave the
// cursor on the next entry.
auto read_entry(ByteReader &in) -> Entry;

/**
 * Decode a whole pack stream into `store`.
 *
 * Plain entries are written under their own kind; ref-deltas are applied to
 * their base from the store and written under the base's kind. A delta whose
 * base shows up later in the same pack is retried once more entries are in.
 * The trailing SHA-1 is checked before any entry is decoded.
 */
auto unpack(const ObjectStore &store, std::span<const std::uint8_t> pack_bytes) -> UnpackStats;

} // namespace pack

} // namespace clonekit

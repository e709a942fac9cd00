#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clonekit {

class ObjectStore; // fwd

struct CommitInfo {
  std::string tree_hex;
  std::vector<std::string> parents; // zero or more parents (40-hex each)
  std::string author;               // full author line after "author "
  std::string committer;            // full committer line
  std::string message;              // raw message (may contain newlines)
};

namespace commit {

// Parse a commit body. The first header line must be "tree <40-hex>";
// headers we do not model (gpgsig, encoding, ...) are skipped.
[[nodiscard]] auto decode(std::span<const std::uint8_t> payload) -> CommitInfo;

// Format headers, a blank line, then the message verbatim.
[[nodiscard]] auto encode(const CommitInfo &info) -> std::vector<std::uint8_t>;

// Read `hex_oid` from the store and decode it; the object must be a commit.
[[nodiscard]] auto read(const ObjectStore &store, std::string_view hex_oid) -> CommitInfo;

} // namespace commit

} // namespace clonekit

#include "clonekit/tree.hpp"

#include "clonekit/error.hpp"
#include "clonekit/object_store.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>

namespace clonekit::tree {

auto mode_to_ascii_octal(std::uint32_t mode) -> std::string {
  std::array<char, 16> buf{};
  std::snprintf(buf.data(), buf.size(), "%o", mode);
  return {buf.data()};
}

auto ascii_octal_to_mode(std::string_view s) -> std::uint32_t {
  if (s.empty() || s.size() > 7) {
    throw Error(ErrorKind::CorruptObject, "tree parse: bad mode '" + std::string(s) + "'");
  }
  std::uint32_t v = 0;
  for (const char c : s) {
    if (c < '0' || c > '7') {
      throw Error(ErrorKind::CorruptObject, "tree parse: bad mode '" + std::string(s) + "'");
    }
    v = static_cast<std::uint32_t>((v << 3U) + static_cast<unsigned>(c - '0'));
  }
  return v;
}

std::vector<TreeEntry> decode(std::span<const std::uint8_t> payload) {
  std::vector<TreeEntry> out;
  auto p = payload.begin();
  const auto end = payload.end();

  while (p < end) {
    const auto q_space = std::find(p, end, static_cast<std::uint8_t>(consts::kSpace));
    if (q_space == end) {
      throw Error(ErrorKind::CorruptObject, "tree parse: expected space");
    }
    const std::string mode_str(p, q_space);
    const std::uint32_t mode = ascii_octal_to_mode(mode_str);

    p = q_space + 1;
    const auto q_nul = std::find(p, end, static_cast<std::uint8_t>(consts::kNul));
    if (q_nul == end) {
      throw Error(ErrorKind::CorruptObject, "tree parse: expected NUL");
    }
    std::string name(p, q_nul);
    if (name.empty()) {
      throw Error(ErrorKind::CorruptObject, "tree parse: empty entry name");
    }
    p = q_nul + 1;

    if (static_cast<std::size_t>(end - p) < consts::kOidRawLen) {
      throw Error(ErrorKind::CorruptObject, "tree parse: truncated oid");
    }

    TreeEntry e{};
    e.mode = mode;
    e.name = std::move(name);
    std::memcpy(e.id.data(), &(*p), consts::kOidRawLen);
    p += static_cast<std::ptrdiff_t>(consts::kOidRawLen);

    out.push_back(std::move(e));
  }
  return out;
}

std::vector<std::uint8_t> encode(const std::vector<TreeEntry> &entries) {
  std::vector<std::uint8_t> data;
  for (const auto &e : entries) {
    const std::string mode = mode_to_ascii_octal(e.mode);
    data.insert(data.end(), mode.begin(), mode.end());
    data.push_back(static_cast<std::uint8_t>(consts::kSpace));
    data.insert(data.end(), e.name.begin(), e.name.end());
    data.push_back(static_cast<std::uint8_t>(consts::kNul));
    data.insert(data.end(), e.id.begin(), e.id.end());
  }
  return data;
}

std::vector<TreeEntry> read(const ObjectStore &store, std::string_view hex_oid) {
  const auto obj = store.read(hex_oid);
  if (obj.kind != ObjectKind::Tree) {
    throw Error(ErrorKind::CorruptObject, "object is not a tree: " + std::string(hex_oid));
  }
  return decode(obj.data);
}

} // namespace clonekit::tree

#include "clonekit/object_store.hpp"

#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"
#include "clonekit/fs.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace cfs = clonekit::fs;

namespace clonekit {

namespace {

std::vector<std::uint8_t> with_header(ObjectKind kind, std::span<const std::uint8_t> payload) {
  const std::string hdr = object_header(kind_name(kind), payload.size());
  std::vector<std::uint8_t> store;
  store.reserve(hdr.size() + payload.size());
  store.insert(store.end(), reinterpret_cast<const std::uint8_t *>(hdr.data()),
               reinterpret_cast<const std::uint8_t *>(hdr.data()) + hdr.size());
  store.insert(store.end(), payload.begin(), payload.end());
  return store;
}

} // namespace

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir =
      gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

oid ObjectStore::hash_object(ObjectKind kind, std::span<const std::uint8_t> payload) {
  return sha1(with_header(kind, payload));
}

bool ObjectStore::contains(std::string_view hex_oid) const {
  return cfs::exists(path_for_oid(parse_hex(hex_oid)));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  const auto path = path_for_oid(parse_hex(hex_oid));
  if (!cfs::exists(path)) {
    throw Error(ErrorKind::NotFound, "object_store: object not found: " + std::string(hex_oid));
  }

  std::vector<std::uint8_t> store;
  try {
    store = cfs::z_decompress(cfs::read_file(path));
  } catch (const Error &e) {
    throw Error(ErrorKind::CorruptObject,
                "object_store: " + std::string(hex_oid) + ": " + e.what());
  }

  const auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(consts::kSpace));
  if (it_space == store.end()) {
    throw Error(ErrorKind::CorruptObject,
                "object_store: invalid header in " + std::string(hex_oid));
  }
  const auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == store.end()) {
    throw Error(ErrorKind::CorruptObject,
                "object_store: invalid header in " + std::string(hex_oid));
  }

  const std::string type(store.begin(), it_space);
  const auto kind = parse_kind(type);
  if (!kind) {
    throw Error(ErrorKind::CorruptObject,
                "object_store: unsupported object type '" + type + "' in " + std::string(hex_oid));
  }

  const std::string len_str(it_space + 1, it_nul);
  std::size_t declared = 0;
  const auto [ptr, ec] = std::from_chars(len_str.data(), len_str.data() + len_str.size(), declared);
  const std::size_t payload_off = static_cast<std::size_t>(it_nul - store.begin()) + 1;
  if (ec != std::errc{} || ptr != len_str.data() + len_str.size() || len_str.empty() ||
      declared != store.size() - payload_off) {
    throw Error(ErrorKind::CorruptObject,
                "object_store: length mismatch in " + std::string(hex_oid));
  }

  return Object{.kind = *kind, .data = {store.begin() + static_cast<std::ptrdiff_t>(payload_off),
                                        store.end()}};
}

std::string ObjectStore::write(ObjectKind kind, std::span<const std::uint8_t> payload) const {
  const auto store = with_header(kind, payload);
  const oid store_id = sha1(store);
  const auto path = path_for_oid(store_id);
  if (!cfs::exists(path)) {
    const auto compressed = cfs::z_compress(store);
    cfs::write_file_atomic(path, compressed);
  }
  return to_hex(store_id);
}

} // namespace clonekit

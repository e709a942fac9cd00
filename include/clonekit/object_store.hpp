#pragma once
#include "clonekit/hash.hpp"
#include "clonekit/object.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clonekit {

class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  // Read and decompress object identified by 40-hex; returns kind and payload.
  // Throws Error{NotFound} if absent, Error{CorruptObject} on a bad file.
  Object read(std::string_view hex_oid) const;

  // Write object with given kind/payload. Returns 40-hex id.
  // Writing an object that already exists leaves the file alone.
  std::string write(ObjectKind kind, std::span<const std::uint8_t> payload) const;

  bool contains(std::string_view hex_oid) const;

  // Get filesystem path for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

  // Id the payload would get, without touching the disk.
  static oid hash_object(ObjectKind kind, std::span<const std::uint8_t> payload);

private:
  std::filesystem::path gitdir_;
};

} // namespace clonekit

#pragma once
#include "clonekit/error.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace clonekit::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data);

// Inflate a complete zlib stream; trailing bytes after the stream are an error.
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

struct InflateResult {
  std::vector<std::uint8_t> data; // inflated bytes
  std::size_t consumed = 0;       // compressed bytes read from the input
};

// Inflate the zlib stream that starts at data[0] and stop at its end marker.
// Bytes after the stream are left untouched; `consumed` says where it ended.
// `size_hint` pre-sizes the output buffer (e.g. a pack entry's declared size);
// it is capped at what `data` could possibly inflate to.
// Input that runs out before the end marker throws Error{truncated_kind}.
InflateResult z_inflate_prefix(std::span<const std::uint8_t> data, std::size_t size_hint = 0,
                               ErrorKind truncated_kind = ErrorKind::CorruptObject);

} // namespace clonekit::fs

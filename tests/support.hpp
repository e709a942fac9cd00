#pragma once
// Shared fixtures for the test executables: temp repos, pack/delta builders
// and an in-memory smart-HTTP remote.
#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"
#include "clonekit/fs.hpp"
#include "clonekit/hash.hpp"
#include "clonekit/http.hpp"
#include "clonekit/util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace testsupport {

namespace fs = std::filesystem;

using bytes = std::vector<std::uint8_t>;

inline bytes to_bytes(std::string_view s) { return {s.begin(), s.end()}; }

inline std::string to_string(std::span<const std::uint8_t> b) { return {b.begin(), b.end()}; }

inline std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Unique directory under the system temp dir, removed on scope exit.
class TempDir {
public:
  explicit TempDir(std::string_view tag)
    : path_(fs::temp_directory_path() /
            ("clonekit_" + std::string(tag) + "_" + std::to_string(std::random_device{}()))) {
    fs::create_directories(path_);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  [[nodiscard]] const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

// Run `fn` and report whether it threw clonekit::Error of `kind`.
template <typename Fn> bool throws_kind(clonekit::ErrorKind kind, Fn &&fn) {
  try {
    fn();
  } catch (const clonekit::Error &e) {
    if (e.kind() != kind) {
      std::cerr << "  got " << clonekit::error_kind_name(e.kind()) << ": " << e.what() << "\n";
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    std::cerr << "  got non-clonekit exception: " << e.what() << "\n";
    return false;
  }
  std::cerr << "  nothing thrown\n";
  return false;
}

// Pack entry header: type in bits 4-6, size 4 bits then 7 bits per byte.
inline bytes encode_pack_entry_header(std::uint8_t type, std::uint64_t size) {
  bytes out;
  std::uint8_t first = static_cast<std::uint8_t>((type << 4U) | (size & 0x0FU));
  size >>= 4U;
  if (size != 0) {
    first |= 0x80U;
  }
  out.push_back(first);
  while (size != 0) {
    auto b = static_cast<std::uint8_t>(size & 0x7FU);
    size >>= 7U;
    if (size != 0) {
      b |= 0x80U;
    }
    out.push_back(b);
  }
  return out;
}

// Delta length prefix: 7 bits per byte, little-endian.
inline bytes encode_delta_length(std::uint64_t v) {
  bytes out;
  do {
    auto b = static_cast<std::uint8_t>(v & 0x7FU);
    v >>= 7U;
    if (v != 0) {
      b |= 0x80U;
    }
    out.push_back(b);
  } while (v != 0);
  return out;
}

class DeltaBuilder {
public:
  DeltaBuilder(std::uint64_t source_len, std::uint64_t target_len) {
    append(encode_delta_length(source_len));
    append(encode_delta_length(target_len));
  }

  // Emit only the non-zero offset/size bytes, as git does.
  DeltaBuilder &copy(std::uint32_t offset, std::uint32_t size) {
    std::uint8_t op = 0x80;
    bytes args;
    for (unsigned i = 0; i < 4; ++i) {
      const auto b = static_cast<std::uint8_t>((offset >> (8U * i)) & 0xFFU);
      if (b != 0) {
        op |= static_cast<std::uint8_t>(1U << i);
        args.push_back(b);
      }
    }
    for (unsigned i = 0; i < 3; ++i) {
      const auto b = static_cast<std::uint8_t>((size >> (8U * i)) & 0xFFU);
      if (b != 0) {
        op |= static_cast<std::uint8_t>(1U << (4 + i));
        args.push_back(b);
      }
    }
    data_.push_back(op);
    append(args);
    return *this;
  }

  DeltaBuilder &insert(std::string_view literal) {
    data_.push_back(static_cast<std::uint8_t>(literal.size()));
    data_.insert(data_.end(), literal.begin(), literal.end());
    return *this;
  }

  [[nodiscard]] const bytes &data() const { return data_; }

private:
  void append(const bytes &b) { data_.insert(data_.end(), b.begin(), b.end()); }
  bytes data_;
};

class PackBuilder {
public:
  PackBuilder &add(std::uint8_t type, std::span<const std::uint8_t> payload,
                   std::optional<clonekit::oid> base = std::nullopt) {
    return add_raw(type, payload.size(), payload, base);
  }

  // Declared size may differ from the payload (for corrupt-pack tests).
  PackBuilder &add_raw(std::uint8_t type, std::uint64_t declared,
                       std::span<const std::uint8_t> payload,
                       std::optional<clonekit::oid> base = std::nullopt) {
    const auto hdr = encode_pack_entry_header(type, declared);
    body_.insert(body_.end(), hdr.begin(), hdr.end());
    if (base) {
      body_.insert(body_.end(), base->begin(), base->end());
    }
    const auto z = clonekit::fs::z_compress(payload);
    body_.insert(body_.end(), z.begin(), z.end());
    ++count_;
    return *this;
  }

  // "PACK", version 2, count, entries, SHA-1 trailer.
  [[nodiscard]] bytes finish() const {
    bytes out = to_bytes(clonekit::consts::kPackMagic);
    put_be32(out, 2);
    put_be32(out, count_);
    out.insert(out.end(), body_.begin(), body_.end());
    const auto sum = clonekit::sha1(out);
    out.insert(out.end(), sum.begin(), sum.end());
    return out;
  }

private:
  static void put_be32(bytes &out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24U));
    out.push_back(static_cast<std::uint8_t>(v >> 16U));
    out.push_back(static_cast<std::uint8_t>(v >> 8U));
    out.push_back(static_cast<std::uint8_t>(v));
  }

  bytes body_;
  std::uint32_t count_ = 0;
};

// Replace a pack's trailing SHA-1 after its body was edited.
inline void resign_pack(bytes &pack) {
  pack.resize(pack.size() - clonekit::consts::kPackTrailerLen);
  const auto sum = clonekit::sha1(pack);
  pack.insert(pack.end(), sum.begin(), sum.end());
}

// Serves a canned info/refs body and a canned upload-pack response.
class FixtureRemote final : public clonekit::http::Client {
public:
  FixtureRemote(std::string advertisement, bytes upload_response)
    : advertisement_(std::move(advertisement)), upload_response_(std::move(upload_response)) {}

  auto get(const std::string &url) -> bytes override {
    gets.push_back(url);
    if (!url.ends_with(clonekit::consts::kInfoRefsPath)) {
      throw clonekit::Error(clonekit::ErrorKind::TransportError, "HTTP 404 from " + url);
    }
    return to_bytes(advertisement_);
  }

  auto post(const std::string &url, std::string_view content_type,
            std::span<const std::uint8_t> body) -> bytes override {
    posts.push_back(url);
    last_content_type = std::string(content_type);
    last_post_body = to_string(body);
    return upload_response_;
  }

  std::vector<std::string> gets;
  std::vector<std::string> posts;
  std::string last_content_type;
  std::string last_post_body;

private:
  std::string advertisement_;
  bytes upload_response_;
};

} // namespace testsupport

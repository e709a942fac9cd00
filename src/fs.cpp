#include "clonekit/fs.hpp"

#include "clonekit/error.hpp"

#include <algorithm>
#include <climits>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace clonekit::fs {

namespace {

// Upper bound on deflate's expansion ratio.
constexpr std::size_t kMaxInflateRatio = 1032;

// Ends the inflate state on every exit path.
class InflateStream {
public:
  InflateStream() {
    if (inflateInit(&zs_) != Z_OK) {
      throw std::runtime_error("zlib inflateInit failed");
    }
  }
  InflateStream(const InflateStream &) = delete;
  auto operator=(const InflateStream &) -> InflateStream & = delete;
  ~InflateStream() { inflateEnd(&zs_); }

  auto get() -> z_stream * { return &zs_; }

private:
  z_stream zs_{};
};

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  return buf;
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp);
      throw std::runtime_error("atomic replace failed: " + p.string() + ": " + ec.message());
    }
  }
}

std::vector<std::uint8_t> z_compress(std::span<const std::uint8_t> data) {
  uLongf bound = compressBound(static_cast<uLong>(data.size()));
  std::vector<std::uint8_t> out(bound);
  const int rc = compress2(out.data(), &bound, reinterpret_cast<const Bytef *>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_SPEED);
  if (rc != Z_OK)
    throw std::runtime_error("zlib compress failed");
  out.resize(bound);
  return out;
}

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data) {
  auto res = z_inflate_prefix(data, data.size() * 3);
  if (res.consumed != data.size()) {
    throw Error(ErrorKind::CorruptObject, "zlib: trailing bytes after compressed stream");
  }
  return std::move(res.data);
}

InflateResult z_inflate_prefix(std::span<const std::uint8_t> data, std::size_t size_hint,
                               ErrorKind truncated_kind) {
  InflateStream stream;
  z_stream *zs = stream.get();
  // zlib counts input in uInt; a single entry never comes close, so clamp the window.
  zs->next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(data.data()));
  zs->avail_in = static_cast<uInt>(std::min<std::size_t>(data.size(), UINT_MAX));

  const std::size_t ceiling =
      data.size() > SIZE_MAX / kMaxInflateRatio ? SIZE_MAX : data.size() * kMaxInflateRatio;
  std::vector<std::uint8_t> out(std::max<std::size_t>(std::min(size_hint, ceiling), 64));
  for (;;) {
    if (zs->total_out == out.size()) {
      out.resize(out.size() * 2);
    }
    zs->next_out = out.data() + zs->total_out;
    zs->avail_out = static_cast<uInt>(out.size() - zs->total_out);

    const int rc = inflate(zs, Z_NO_FLUSH);
    if (rc == Z_STREAM_END) {
      break;
    }
    if (rc == Z_OK) {
      continue;
    }
    if (rc == Z_BUF_ERROR && zs->avail_in != 0) {
      continue; // output full; grow and go again
    }
    if (rc == Z_BUF_ERROR) {
      throw Error(truncated_kind, "zlib: compressed stream is truncated");
    }
    throw Error(ErrorKind::CorruptObject,
                std::string("zlib inflate failed: ") + (zs->msg ? zs->msg : "unknown error"));
  }

  out.resize(zs->total_out);
  return InflateResult{.data = std::move(out), .consumed = static_cast<std::size_t>(zs->total_in)};
}

} // namespace clonekit::fs

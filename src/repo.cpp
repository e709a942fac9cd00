#include "clonekit/repo.hpp"

#include "clonekit/error.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace stdfs = std::filesystem;

namespace clonekit {

Repository::Repository(stdfs::path root) : root_(std::move(root)) {}

auto Repository::is_initialized() const -> bool { return stdfs::exists(git_dir()); }

void Repository::init_layout() const {
  if (is_initialized()) {
    throw std::runtime_error("a repository already exists at: " + git_dir().string());
  }

  std::error_code ec;
  stdfs::create_directories(objects_dir(), ec);
  if (ec) {
    throw std::runtime_error("create objects dir failed: " + ec.message());
  }
  stdfs::create_directories(heads_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/heads dir failed: " + ec.message());
  }
  stdfs::create_directories(tags_dir(), ec);
  if (ec) {
    throw std::runtime_error("create refs/tags dir failed: " + ec.message());
  }
}

auto Repository::read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t> {
  auto obj = objects().read(hex_oid);
  if (obj.kind != ObjectKind::Blob) {
    throw Error(ErrorKind::CorruptObject, "object is not a blob: " + std::string(hex_oid));
  }
  return std::move(obj.data);
}

} // namespace clonekit

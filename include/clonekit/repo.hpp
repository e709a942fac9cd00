#pragma once
#include "clonekit/consts.hpp"
#include "clonekit/object_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>

namespace clonekit {

class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto git_dir() const -> std::filesystem::path { return root_ / consts::kGitDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return git_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return git_dir() / consts::kRefsDir;
  }
  [[nodiscard]] auto heads_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kHeadsDir;
  }
  [[nodiscard]] auto tags_dir() const -> std::filesystem::path {
    return refs_dir() / consts::kTagsDir;
  }
  [[nodiscard]] auto head_file() const -> std::filesystem::path {
    return git_dir() / consts::kHeadFile;
  }

  // Create .git/objects and .git/refs/{heads,tags} under root_.
  // Fails if .git already exists (to avoid clobber). HEAD is written by
  // whoever knows what it should point at.
  void init_layout() const;

  // Convenience: does .git exist?
  [[nodiscard]] auto is_initialized() const -> bool;

  [[nodiscard]] auto objects() const -> ObjectStore { return ObjectStore{git_dir()}; }

  // Payload of a blob; throws Error{CorruptObject} if the id names another kind.
  [[nodiscard]] auto read_blob(std::string_view hex_oid) const -> std::vector<std::uint8_t>;

private:
  std::filesystem::path root_;
};

} // namespace clonekit

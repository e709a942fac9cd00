#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clonekit {

class ObjectStore; // fwd
class Repository;  // fwd

namespace checkout {

struct WrittenFile {
  std::string path;     // relative to the destination, '/'-separated
  std::uint32_t mode;   // consts::kModeFile or consts::kModeExec
  std::string blob_hex;
};

// Write every file reachable from `tree_hex` under `dest`, breadth-first:
// all entries of a tree are handled before any of its subtrees, subtrees in
// the order they were listed. Files with mode 100755 get execute bits,
// others do not. Directories appear when their first file is written.
// Returns the files in the order they were written.
auto materialize_tree(const ObjectStore &store, std::string_view tree_hex,
                      const std::filesystem::path &dest) -> std::vector<WrittenFile>;

// Resolve HEAD to a commit and materialize its tree into the work tree.
auto checkout_head(const Repository &repo) -> std::vector<WrittenFile>;

} // namespace checkout

} // namespace clonekit

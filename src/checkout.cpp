#include "clonekit/checkout.hpp"

#include "clonekit/commit.hpp"
#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"
#include "clonekit/fs.hpp"
#include "clonekit/object_store.hpp"
#include "clonekit/refs.hpp"
#include "clonekit/repo.hpp"
#include "clonekit/tree.hpp"

#include <deque>

namespace stdfs = std::filesystem;

namespace clonekit::checkout {

namespace {

struct WorkItem {
  std::string tree_hex;
  std::string rel; // "" for the root tree, otherwise "a/b"
};

constexpr auto kExecBits =
    stdfs::perms::owner_exec | stdfs::perms::group_exec | stdfs::perms::others_exec;

// Tree entry names come from the remote; keep them inside the destination.
void check_entry_name(const std::string &name, const std::string &tree_hex) {
  if (name == "." || name == ".." || name == consts::kGitDir ||
      name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    throw Error(ErrorKind::CorruptObject,
                "checkout: refusing entry '" + name + "' in tree " + tree_hex);
  }
}

std::string join(const std::string &prefix, const std::string &name) {
  return prefix.empty() ? name : prefix + "/" + name;
}

void write_blob(const ObjectStore &store, const std::string &blob_hex, const stdfs::path &path,
                std::uint32_t mode) {
  const auto obj = store.read(blob_hex);
  if (obj.kind != ObjectKind::Blob) {
    throw Error(ErrorKind::CorruptObject, "checkout: object is not a blob: " + blob_hex);
  }
  fs::write_file_atomic(path, obj.data);
  stdfs::permissions(path, kExecBits,
                     tree::is_executable(mode) ? stdfs::perm_options::add
                                               : stdfs::perm_options::remove);
}

} // namespace

auto materialize_tree(const ObjectStore &store, std::string_view tree_hex,
                      const stdfs::path &dest) -> std::vector<WrittenFile> {
  std::vector<WrittenFile> written;
  std::deque<WorkItem> queue;
  queue.push_back(WorkItem{.tree_hex = std::string(tree_hex), .rel = {}});

  while (!queue.empty()) {
    const WorkItem item = std::move(queue.front());
    queue.pop_front();

    for (const auto &e : tree::read(store, item.tree_hex)) {
      check_entry_name(e.name, item.tree_hex);
      const std::string rel = join(item.rel, e.name);

      if (tree::is_directory(e.mode)) {
        queue.push_back(WorkItem{.tree_hex = to_hex(e.id), .rel = rel});
        continue;
      }
      if (e.mode != consts::kModeFile && e.mode != consts::kModeExec) {
        throw Error(ErrorKind::CorruptObject, "checkout: unsupported mode " +
                                                  tree::mode_to_ascii_octal(e.mode) + " for " +
                                                  rel);
      }
      const std::string blob_hex = to_hex(e.id);
      write_blob(store, blob_hex, dest / stdfs::path(rel), e.mode);
      written.push_back(WrittenFile{.path = rel, .mode = e.mode, .blob_hex = blob_hex});
    }
  }
  return written;
}

auto checkout_head(const Repository &repo) -> std::vector<WrittenFile> {
  const std::string commit_hex = resolve_HEAD(repo.root());
  const ObjectStore store = repo.objects();
  const CommitInfo info = commit::read(store, commit_hex);
  return materialize_tree(store, info.tree_hex, repo.root());
}

} // namespace clonekit::checkout

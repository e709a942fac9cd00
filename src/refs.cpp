#include "clonekit/refs.hpp"

#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"
#include "clonekit/fs.hpp"
#include "clonekit/util.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

namespace clonekit {

static std::filesystem::path git_dir(const std::filesystem::path &root) {
  return root / consts::kGitDir;
}

static std::filesystem::path head_file(const std::filesystem::path &root) {
  return git_dir(root) / consts::kHeadFile;
}

static std::filesystem::path ref_path(const std::filesystem::path &root,
                                      const std::string &refname) {
  if (!is_safe_refname(refname)) {
    throw std::invalid_argument("refusing unsafe ref name: '" + refname + "'");
  }
  return git_dir(root) / refname;
}

bool is_safe_refname(std::string_view refname) {
  if (!refname.starts_with("refs/")) {
    return false;
  }
  if (refname.find('\\') != std::string_view::npos ||
      refname.find(consts::kNul) != std::string_view::npos) {
    return false;
  }
  std::size_t pos = 0;
  for (;;) {
    const std::size_t slash = refname.find('/', pos);
    const std::string_view part =
        refname.substr(pos, slash == std::string_view::npos ? std::string_view::npos : slash - pos);
    if (part.empty() || part == "." || part == "..") {
      return false;
    }
    if (slash == std::string_view::npos) {
      return true;
    }
    pos = slash + 1;
  }
}

std::optional<std::string> read_HEAD(const std::filesystem::path &repo_root) {
  const auto head_file_ptr = head_file(repo_root);
  if (!fs::exists(head_file_ptr)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(head_file_ptr);
  std::string str(bytes.begin(), bytes.end());
  return str;
}

void set_HEAD_symbolic(const std::filesystem::path &repo_root, const std::string &refname) {
  const std::string ref_str = std::string(consts::kRefPrefix) + refname + "\n";
  fs::write_file_atomic(head_file(repo_root), as_bytes(ref_str));
}

void set_HEAD_detached(const std::filesystem::path &repo_root, std::string_view hex_oid) {
  const std::string s = std::string(hex_oid) + "\n";
  fs::write_file_atomic(head_file(repo_root), as_bytes(s));
}

std::optional<std::string> read_ref(const std::filesystem::path &repo_root,
                                    const std::string &refname) {
  const auto p = ref_path(repo_root, refname);
  if (!fs::exists(p)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(p);
  std::string s(bytes.begin(), bytes.end());
  strutil::rstrip_newlines(s);
  return s;
}

void update_ref(const std::filesystem::path &repo_root, const std::string &refname,
                const std::string &hex_oid) {
  const auto p = ref_path(repo_root, refname);
  const std::string s = hex_oid + "\n";
  fs::write_file_atomic(p, as_bytes(s));
}

std::string resolve_HEAD(const std::filesystem::path &repo_root) {
  auto head_txt = read_HEAD(repo_root);
  if (!head_txt) {
    throw Error(ErrorKind::NotFound, "refs: HEAD not found in " + git_dir(repo_root).string());
  }
  std::string s = *head_txt;
  strutil::rstrip_newlines(s);

  if (s.starts_with(consts::kRefPrefix)) {
    const std::string refname = s.substr(consts::kRefPrefix.size());
    auto tip = read_ref(repo_root, refname);
    if (!tip || !looks_hex40(*tip)) {
      throw Error(ErrorKind::NotFound, "refs: HEAD points at missing ref " + refname);
    }
    return *tip;
  }
  if (!looks_hex40(s)) {
    throw Error(ErrorKind::NotFound, "refs: HEAD holds neither a ref nor an object id");
  }
  return s;
}

} // namespace clonekit

#include "clonekit/config.hpp"

#include "clonekit/consts.hpp"
#include "clonekit/fs.hpp"
#include "clonekit/util.hpp"

#include <sstream>
#include <string_view>

namespace clonekit {

namespace {

std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kGitDir / consts::kConfigFile;
}

constexpr std::string_view kUrlKey = "url:";
constexpr std::string_view kBranchKey = "branch:";

} // namespace

auto load_remote_config(const std::filesystem::path &repo_root) -> RemoteConfig {
  RemoteConfig out{};
  const auto path = cfg_path(repo_root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(kUrlKey)) {
      out.url = strutil::trim(sv.substr(kUrlKey.size()));
    } else if (sv.starts_with(kBranchKey)) {
      out.branch = strutil::trim(sv.substr(kBranchKey.size()));
    }
  }
  return out;
}

void save_remote_config(const std::filesystem::path &repo_root, const RemoteConfig &cfg) {
  std::ostringstream os;
  os << kUrlKey << ' ' << cfg.url << '\n' << kBranchKey << ' ' << cfg.branch << '\n';
  fs::write_file_atomic(cfg_path(repo_root), as_bytes(os.str()));
}

} // namespace clonekit

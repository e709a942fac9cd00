#pragma once
#include <filesystem>
#include <string>

namespace clonekit {

// Where a clone came from.
struct RemoteConfig {
  std::string url;    // smart-HTTP base URL
  std::string branch; // default branch advertised by the remote (may be empty)
};

// Read .git/config (empty fields if missing)
RemoteConfig load_remote_config(const std::filesystem::path& repo_root);

// Overwrite .git/config with the given remote
void save_remote_config(const std::filesystem::path& repo_root, const RemoteConfig& cfg);

} // namespace clonekit

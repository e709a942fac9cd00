#include "cli/command.hpp"

#include "clonekit/http.hpp"
#include "clonekit/remote.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace {

// "https://host/team/project.git/" -> "project"
std::string default_dir_for(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  std::string name = url.substr(url.find_last_of('/') + 1);
  if (name.ends_with(".git")) {
    name.resize(name.size() - 4);
  }
  return name;
}

} // namespace

int cmd_clone(int argc, char **argv) {
  if (argc < 2 || argc > 3) {
    return clonekit::cli::kUsageError;
  }
  const std::string url = argv[1];
  const std::string dir = argc >= 3 ? std::string(argv[2]) : default_dir_for(url);
  if (dir.empty()) {
    std::cerr << "clone: cannot derive a directory name from " << url << "\n";
    return clonekit::cli::kUsageError;
  }
  clonekit::http::CurlClient client;
  const auto res = clonekit::remote::clone_repo(client, url, dir);
  std::cout << "Cloned into '" << dir << "': " << res.refs.refs.size() << " refs, "
            << res.pack.objects << " objects (" << res.pack.deltas << " from deltas), "
            << res.files.size() << " files\n";
  return clonekit::cli::kOk;
}

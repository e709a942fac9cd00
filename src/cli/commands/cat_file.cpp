#include "cli/command.hpp"

#include "clonekit/object_store.hpp"
#include "clonekit/repo.hpp"
#include "clonekit/tree.hpp"

#include <filesystem>
#include <iostream>
#include <string_view>

namespace {

void print_tree(const clonekit::Object &obj) {
  for (const auto &e : clonekit::tree::decode(obj.data)) {
    const bool dir = clonekit::tree::is_directory(e.mode);
    std::cout << (dir ? "040000" : clonekit::tree::mode_to_ascii_octal(e.mode)) << ' '
              << (dir ? "tree" : "blob") << ' ' << clonekit::to_hex(e.id) << '\t' << e.name
              << "\n";
  }
}

} // namespace

int cmd_cat_file(int argc, char **argv) {
  if (argc != 3) {
    return clonekit::cli::kUsageError;
  }
  const std::string_view flag = argv[1];
  if (flag != "-t" && flag != "-s" && flag != "-p") {
    return clonekit::cli::kUsageError;
  }
  const clonekit::Repository repo{std::filesystem::current_path()};
  if (!repo.is_initialized()) {
    std::cerr << "cat-file: not a repository (no .git here)\n";
    return clonekit::cli::kFailed;
  }

  const auto obj = repo.objects().read(argv[2]);
  if (flag == "-t") {
    std::cout << clonekit::kind_name(obj.kind) << "\n";
  } else if (flag == "-s") {
    std::cout << obj.data.size() << "\n";
  } else if (obj.kind == clonekit::ObjectKind::Tree) {
    print_tree(obj);
  } else {
    std::cout.write(reinterpret_cast<const char *>(obj.data.data()),
                    static_cast<std::streamsize>(obj.data.size()));
  }
  return clonekit::cli::kOk;
}

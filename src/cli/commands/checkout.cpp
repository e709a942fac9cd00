#include "cli/command.hpp"

#include "clonekit/checkout.hpp"
#include "clonekit/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_checkout(int argc, char ** /*argv*/) {
  if (argc > 1) {
    return clonekit::cli::kUsageError;
  }
  const clonekit::Repository repo{std::filesystem::current_path()};
  if (!repo.is_initialized()) {
    std::cerr << "checkout: not a repository (no .git here)\n";
    return clonekit::cli::kFailed;
  }
  const auto files = clonekit::checkout::checkout_head(repo);
  std::cout << "Checked out " << files.size() << " files from HEAD\n";
  return clonekit::cli::kOk;
}

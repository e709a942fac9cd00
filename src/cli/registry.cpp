#include "cli/registry.hpp"

#include "clonekit/error.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace clonekit::cli {

namespace {

struct entry {
  std::string name;
  command_fn fn;
  std::string usage;
  std::string summary;
};

// Registration order is the order of a typical session: clone, then inspect.
std::vector<entry> &table() {
  static std::vector<entry> t;
  return t;
}

const entry *find(const std::string &name) {
  const auto it = std::ranges::find(table(), name, &entry::name);
  return it == table().end() ? nullptr : &*it;
}

void print_usage() {
  std::cerr << "usage: clonekit <command> [args]\n\n";
  for (const auto &e : table()) {
    std::cerr << "  clonekit " << e.name << ' ' << e.usage << "\n      " << e.summary << "\n";
  }
}

int run(const entry &e, int argc, char **argv) {
  try {
    const int rc = e.fn(argc, argv);
    if (rc == kUsageError) {
      std::cerr << "usage: clonekit " << e.name << ' ' << e.usage << "\n";
    }
    return rc;
  } catch (const Error &err) {
    std::cerr << e.name << ": " << error_kind_name(err.kind()) << ": " << err.what() << "\n";
  } catch (const std::exception &err) {
    std::cerr << e.name << ": " << err.what() << "\n";
  }
  return kFailed;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &usage,
                      const std::string &summary) {
  table().push_back(entry{.name = name, .fn = fn, .usage = usage, .summary = summary});
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return kUsageError;
  }
  const entry *e = find(argv[1]);
  if (e == nullptr) {
    std::cerr << "unknown command: " << argv[1] << "\n";
    print_usage();
    return kUsageError;
  }
  return run(*e, argc - 1, argv + 1);
}

} // namespace clonekit::cli

#include "cli/registry.hpp"

int cmd_clone(int argc, char **argv);
int cmd_cat_file(int argc, char **argv);
int cmd_checkout(int argc, char **argv);

namespace clonekit::cli {

void register_all_commands() {
  register_command("clone", ::cmd_clone, "<url> [dir]",
                   "fetch a repository over smart HTTP and check out its HEAD");
  register_command("cat-file", ::cmd_cat_file, "(-t | -s | -p) <oid>",
                   "print an object's type, size or content");
  register_command("checkout", ::cmd_checkout, "",
                   "rewrite the work tree from the commit HEAD names");
}

} // namespace clonekit::cli

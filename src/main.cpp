#include "cli/registry.hpp"

int main(int argc, char **argv) {
  clonekit::cli::register_all_commands();
  return clonekit::cli::dispatch(argc, argv);
}

#pragma once
#include <string>
#include "cli/command.hpp"

namespace clonekit::cli {

// `usage` is the argument synopsis ("<url> [dir]"), `summary` one line of help.
void register_command(const std::string& name, command_fn fn, const std::string& usage,
                      const std::string& summary);

// Look up argv[1] and run it. Errors escaping a handler are reported as
// "<command>: <kind>: <message>" and turn into exit code 1.
int dispatch(int argc, char** argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace clonekit::cli

#pragma once

namespace clonekit::cli {

// Handler receives argv starting at the subcommand name. Returning
// kUsageError makes the dispatcher print that command's usage line.
using command_fn = int (*)(int argc, char **argv);

inline constexpr int kOk = 0;
inline constexpr int kFailed = 1;
inline constexpr int kUsageError = 2;

} // namespace clonekit::cli

#pragma once

#include <string>
#include <vector>

namespace warden {
namespace process {

// Exit status reported when the command could not be started at all
// (shell convention for "command not found").
constexpr int kCommandNotStarted = 127;

// Runs argv in the foreground with inherited stdio and waits for it.
// Returns the command's exit status; a command killed by signal N reports 128 + N.
// If the command cannot be started, returns kCommandNotStarted and sets error.
// unset_environment lists variables removed from the child's environment.
int run_foreground(const std::vector<std::string> &argv, std::string &error,
                   const std::vector<std::string> &unset_environment = {});

}  // namespace process
}  // namespace warden

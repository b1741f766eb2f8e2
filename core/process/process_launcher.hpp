#pragma once

#include <optional>
#include <string>
#include <vector>

#include "process_types.hpp"

namespace warden {
namespace process {

struct LaunchRequest {
    std::string executable;                     // Path (or PATH-resolvable name) of the worker
    std::vector<std::string> arguments;         // argv[1..]: extra flags, then the prompt
    std::vector<std::string> unset_environment; // Variables removed from the inherited environment
    NativeHandle output = kInvalidHandle;       // Receives merged stdout + stderr
};

// Interface for the launcher to enable mocking
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Spawn request.executable detached from the caller's session.
    // Returns the new pid as soon as the spawn call succeeds, without waiting for
    // the child to initialize. Returns std::nullopt and sets error if the
    // executable cannot be started; nothing is retried.
    virtual std::optional<ProcessId> launch(const LaunchRequest &request, std::string &error) = 0;
};

// DetachedProcessLauncher starts the worker so that it outlives the caller and
// does not receive the caller's terminal signals.
// - POSIX: fork + setsid + execvp, stdin from /dev/null, stdout/stderr dup'ed
//   onto request.output. exec failures are reported back through a
//   close-on-exec pipe so launch() fails synchronously.
// - Windows: CreateProcess with CREATE_NEW_PROCESS_GROUP (no DETACHED_PROCESS),
//   inheritable output handle for stdout/stderr, filtered environment block.
class DetachedProcessLauncher : public IProcessLauncher {
public:
    std::optional<ProcessId> launch(const LaunchRequest &request, std::string &error) override;

private:
#ifdef _WIN32
    std::optional<ProcessId> launch_windows(const LaunchRequest &request, std::string &error);
#else
    std::optional<ProcessId> launch_posix(const LaunchRequest &request, std::string &error);
#endif
};

// Returns "NAME=value" entries of source whose NAME is not listed in unset.
// Name comparison is case-insensitive on Windows.
std::vector<std::string> filtered_environment(const std::vector<std::string> &source,
                                              const std::vector<std::string> &unset);

// Snapshot of the calling process's environment as "NAME=value" entries.
std::vector<std::string> current_environment();

#ifdef _WIN32
// Quotes argv for CreateProcess so that CommandLineToArgvW round-trips it.
std::string build_command_line(const std::string &executable, const std::vector<std::string> &arguments);
#endif

}  // namespace process
}  // namespace warden

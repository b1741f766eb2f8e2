#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "runtime/config.hpp"
#include "supervisor/supervisor.hpp"

namespace warden {
namespace cli {

// Global options come before the command; everything after the command is
// left untouched so worker flags are never interpreted by warden.
struct CliOptions {
    std::string config_path = runtime::kDefaultConfigPath;
    bool config_explicit = false;
    std::optional<std::string> log_level;
    std::string command;
    std::vector<std::string> args;
};

// Returns false and sets error on an unknown or incomplete global option.
// No command at all resolves to "help".
bool parse_arguments(int argc, char **argv, CliOptions &options, std::string &error);

struct WorkerInvocation {
    std::vector<std::string> flags;  // Everything before the prompt
    std::string prompt;              // Last token
};

// Splits `[flags...] <prompt>`: the last token is always the prompt, so a
// trailing flag that expects a value is taken as the prompt itself.
// Returns std::nullopt when args is empty.
std::optional<WorkerInvocation> split_worker_arguments(const std::vector<std::string> &args);

// Maps commands to Supervisor operations and prints their results.
// Exit codes: 0 success or benign no-op, 1 usage/operation error,
// collaborator exit status for build and passthrough failures.
class CommandDispatcher {
public:
    CommandDispatcher(const runtime::RuntimeConfig &config, supervisor::Supervisor &supervisor,
                      build::IBuildStep &build_step, std::ostream &out, std::ostream &err);

    int dispatch(const std::string &command, const std::vector<std::string> &args);

private:
    int cmd_help();
    int cmd_version();
    int cmd_start(const std::vector<std::string> &args);
    int cmd_stop(const std::vector<std::string> &args);
    int cmd_status(const std::vector<std::string> &args);
    int cmd_log(const std::vector<std::string> &args);
    int cmd_run(const std::vector<std::string> &args);
    int cmd_build(const std::vector<std::string> &args);
    int cmd_clean(const std::vector<std::string> &args);
    int cmd_passthrough(const std::string &name, const std::vector<std::string> &args);

    int usage_error(const std::string &message, const std::string &usage);

    const runtime::RuntimeConfig &config_;
    supervisor::Supervisor &supervisor_;
    build::IBuildStep &build_step_;
    std::ostream &out_;
    std::ostream &err_;
};

// Status as JSON: {"running", "pid", "log_file", "started_at"}
std::string status_to_json(const supervisor::StatusReport &report);

// Full entry point: parse, load config, wire the system, dispatch.
int run(int argc, char **argv);

}  // namespace cli
}  // namespace warden

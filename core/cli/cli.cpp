#include "cli.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>

#include "build/build_step.hpp"
#include "logging/logger.hpp"
#include "process/command_runner.hpp"
#include "process/liveness_prober.hpp"
#include "process/process_launcher.hpp"
#include "process/process_signaller.hpp"
#include "process/terminator.hpp"
#include "state/log_sink.hpp"
#include "state/pid_store.hpp"

#ifndef WARDEN_VERSION
#define WARDEN_VERSION "unknown"
#endif

namespace warden {
namespace cli {

using json = nlohmann::json;

namespace {

// Matches "--name=value" or "--name value"; advances i past a separate value
bool take_option(const std::string &name, int argc, char **argv, int &i, std::string &value, bool &matched,
                 std::string &error) {
    std::string arg = argv[i];
    std::string prefix = name + "=";
    matched = false;

    if (arg.rfind(prefix, 0) == 0) {
        matched = true;
        value = arg.substr(prefix.size());
    } else if (arg == name) {
        matched = true;
        if (i + 1 >= argc) {
            error = name + " requires a value";
            return false;
        }
        value = argv[++i];
    }

    if (matched && value.empty()) {
        error = name + " requires a value";
        return false;
    }
    return true;
}

}  // namespace

bool parse_arguments(int argc, char **argv, CliOptions &options, std::string &error) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            break;  // command
        }

        if (arg == "--help" || arg == "-h") {
            options.command = "help";
            return true;
        }
        if (arg == "--version") {
            options.command = "version";
            return true;
        }

        std::string value;
        bool matched = false;
        if (!take_option("--config", argc, argv, i, value, matched, error)) {
            return false;
        }
        if (matched) {
            options.config_path = value;
            options.config_explicit = true;
            continue;
        }

        if (!take_option("--log-level", argc, argv, i, value, matched, error)) {
            return false;
        }
        if (matched) {
            if (!logging::is_valid_level(value)) {
                error = "Invalid log level: " + value;
                return false;
            }
            options.log_level = value;
            continue;
        }

        error = "Unknown option: " + arg;
        return false;
    }

    if (i >= argc) {
        options.command = "help";
        return true;
    }

    options.command = argv[i++];
    for (; i < argc; ++i) {
        options.args.emplace_back(argv[i]);
    }
    return true;
}

std::optional<WorkerInvocation> split_worker_arguments(const std::vector<std::string> &args) {
    if (args.empty()) {
        return std::nullopt;
    }
    WorkerInvocation invocation;
    invocation.prompt = args.back();
    invocation.flags.assign(args.begin(), args.end() - 1);
    return invocation;
}

std::string status_to_json(const supervisor::StatusReport &report) {
    json j;
    j["running"] = report.running();
    j["log_file"] = report.log_path;
    if (report.tracked) {
        j["pid"] = report.tracked->pid;
        if (report.tracked->started_at) {
            j["started_at"] = *report.tracked->started_at;
        } else {
            j["started_at"] = nullptr;
        }
    } else {
        j["pid"] = nullptr;
        j["started_at"] = nullptr;
    }
    return j.dump();
}

// ── CommandDispatcher ───────────────────────────────────────

CommandDispatcher::CommandDispatcher(const runtime::RuntimeConfig &config, supervisor::Supervisor &supervisor,
                                     build::IBuildStep &build_step, std::ostream &out, std::ostream &err)
    : config_(config), supervisor_(supervisor), build_step_(build_step), out_(out), err_(err) {}

int CommandDispatcher::dispatch(const std::string &command, const std::vector<std::string> &args) {
    if (command == "help") return cmd_help();
    if (command == "version") return cmd_version();
    if (command == "start") return cmd_start(args);
    if (command == "stop") return cmd_stop(args);
    if (command == "status") return cmd_status(args);
    if (command == "log") return cmd_log(args);
    if (command == "run") return cmd_run(args);
    if (command == "build") return cmd_build(args);
    if (command == "clean") return cmd_clean(args);

    if (config_.commands.count(command) != 0) {
        return cmd_passthrough(command, args);
    }

    err_ << "Error: Unknown command '" << command << "'\n";
    err_ << "Run 'warden help' for available commands\n";
    return 1;
}

int CommandDispatcher::usage_error(const std::string &message, const std::string &usage) {
    err_ << "Error: " << message << "\n";
    err_ << "Usage: " << usage << "\n";
    return 1;
}

// ── help / version ──────────────────────────────────────────

int CommandDispatcher::cmd_help() {
    const auto &name = config_.supervisor.worker_name;
    out_ << "warden - background supervisor for " << name << "\n"
         << "\n"
         << "Usage: warden [--config=PATH] [--log-level=LEVEL] <command> [args...]\n"
         << "\n"
         << "Commands:\n"
         << "  start [flags...] <prompt>  Build and start " << name << " in background\n"
         << "  stop                       Stop the background process\n"
         << "  status [--json]            Check if running\n"
         << "  log                        Display the log of the last session\n"
         << "  run [flags...] [prompt]    Build and run in the foreground\n"
         << "  build                      Build the worker\n"
         << "  clean                      Remove the pid record and log\n"
         << "  version                    Show version\n"
         << "  help                       Show this help\n";

    if (!config_.commands.empty()) {
        out_ << "\nProject commands:\n";
        for (const auto &[cmd, argv] : config_.commands) {
            std::string joined;
            for (const auto &arg : argv) {
                joined += (joined.empty() ? "" : " ") + arg;
            }
            out_ << "  " << cmd << std::string(cmd.size() < 27 ? 27 - cmd.size() : 1, ' ') << joined << "\n";
        }
    }

    out_ << "\n"
         << "Examples:\n"
         << "  warden start 'What is 2+2?'\n"
         << "  warden log\n"
         << "  warden stop\n";
    return 0;
}

int CommandDispatcher::cmd_version() {
    out_ << "warden " << WARDEN_VERSION << "\n";
    return 0;
}

// ── start / stop / status / log ─────────────────────────────

int CommandDispatcher::cmd_start(const std::vector<std::string> &args) {
    const auto &name = config_.supervisor.worker_name;

    auto invocation = split_worker_arguments(args);
    if (!invocation || invocation->prompt.empty()) {
        return usage_error("start command requires a prompt", "warden start [flags...] \"your prompt here\"");
    }

    auto result = supervisor_.start(invocation->prompt, invocation->flags);

    switch (result.outcome) {
        case supervisor::StartOutcome::ALREADY_RUNNING:
            out_ << name << " is already running (PID: " << *result.pid << ")\n";
            out_ << "Use 'warden stop' to stop it first\n";
            return 0;
        case supervisor::StartOutcome::BUILD_FAILED:
            err_ << "Error: " << result.error << "\n";
            return result.build_status;
        case supervisor::StartOutcome::SPAWN_FAILED:
            err_ << "Error: failed to start " << name << ": " << result.error << "\n";
            return 1;
        case supervisor::StartOutcome::STARTED:
            out_ << name << " started (PID: " << *result.pid << ")\n";
            out_ << "Log output: " << supervisor_.status().log_path << "\n";
            out_ << name << " is running\n";
            return 0;
        case supervisor::StartOutcome::EXITED_EARLY:
            out_ << name << " started (PID: " << *result.pid << ")\n";
            err_ << name << " failed to start. Check log file:\n";
            err_ << "  warden log\n";
            return 1;
    }
    return 1;
}

int CommandDispatcher::cmd_stop(const std::vector<std::string> &args) {
    if (!args.empty()) {
        return usage_error("stop takes no arguments", "warden stop");
    }
    const auto &name = config_.supervisor.worker_name;

    auto result = supervisor_.stop();

    switch (result.outcome) {
        case supervisor::StopOutcome::NOTHING_TO_STOP:
            out_ << "No running " << name << " process found\n";
            return 0;
        case supervisor::StopOutcome::STOPPED:
            out_ << "Stopped " << name << " (PID: " << *result.pid << ")\n";
            return 0;
        case supervisor::StopOutcome::ALREADY_GONE:
            out_ << "Process already stopped\n";
            return 0;
        case supervisor::StopOutcome::STILL_RUNNING:
            err_ << "Error: " << name << " (PID: " << *result.pid << ") did not exit after a forced kill\n";
            return 1;
    }
    return 1;
}

int CommandDispatcher::cmd_status(const std::vector<std::string> &args) {
    bool as_json = false;
    for (const auto &arg : args) {
        if (arg == "--json") {
            as_json = true;
        } else {
            return usage_error("unknown status option '" + arg + "'", "warden status [--json]");
        }
    }

    auto report = supervisor_.status();
    if (as_json) {
        out_ << status_to_json(report) << "\n";
        return 0;
    }

    const auto &name = config_.supervisor.worker_name;
    if (report.tracked) {
        out_ << name << " is running (PID: " << report.tracked->pid << ")\n";
        out_ << "  Logs: " << report.tracked->log_path << "\n";
        if (report.tracked->started_at) {
            out_ << "  Started: " << *report.tracked->started_at << "\n";
        }
    } else {
        out_ << name << " is not running\n";
    }
    return 0;
}

int CommandDispatcher::cmd_log(const std::vector<std::string> &args) {
    if (!args.empty()) {
        return usage_error("log takes no arguments", "warden log");
    }

    auto contents = supervisor_.log();
    if (!contents) {
        out_ << "No log file found\n";
        out_ << "Start " << config_.supervisor.worker_name << " first: warden start 'prompt'\n";
        return 0;
    }

    out_ << "=== Logs from " << config_.supervisor.log_file << " ===\n\n";
    out_ << *contents;
    if (!contents->empty() && contents->back() != '\n') {
        out_ << "\n";
    }
    return 0;
}

// ── run / build / clean / passthrough ───────────────────────

int CommandDispatcher::cmd_run(const std::vector<std::string> &args) {
    WorkerInvocation invocation;
    if (auto split = split_worker_arguments(args)) {
        invocation = *split;
    } else {
        invocation.prompt = config_.supervisor.default_prompt;
    }

    std::string error;
    int status = supervisor_.run_in_foreground(invocation.prompt, invocation.flags, error);
    if (!error.empty()) {
        err_ << "Error: " << error << "\n";
    }
    return status;
}

int CommandDispatcher::cmd_build(const std::vector<std::string> &args) {
    if (!args.empty()) {
        return usage_error("build takes no arguments", "warden build");
    }
    if (config_.build.command.empty()) {
        out_ << "No build command configured\n";
        return 0;
    }
    int status = build_step_.run();
    if (status == 0) {
        out_ << "Build complete: " << config_.supervisor.executable << "\n";
    }
    return status;
}

int CommandDispatcher::cmd_clean(const std::vector<std::string> &args) {
    if (!args.empty()) {
        return usage_error("clean takes no arguments", "warden clean");
    }
    const auto &name = config_.supervisor.worker_name;

    // Checked before the hook so it never runs against a live worker;
    // Supervisor::clean re-checks in case one was started since.
    if (supervisor_.status().running()) {
        out_ << name << " is running; use 'warden stop' before cleaning\n";
        return 0;
    }

    std::string error;
    auto hook = config_.commands.find("clean");
    if (hook != config_.commands.end()) {
        int status = process::run_foreground(hook->second, error);
        if (status != 0) {
            if (!error.empty()) {
                err_ << "Error: " << error << "\n";
            }
            return status;
        }
    }

    switch (supervisor_.clean(error)) {
        case supervisor::CleanOutcome::CLEANED:
            out_ << "Clean complete\n";
            return 0;
        case supervisor::CleanOutcome::REFUSED_RUNNING:
            out_ << name << " is running; use 'warden stop' before cleaning\n";
            return 0;
        case supervisor::CleanOutcome::FAILED:
            err_ << "Error: " << error << "\n";
            return 1;
    }
    return 1;
}

int CommandDispatcher::cmd_passthrough(const std::string &name, const std::vector<std::string> &args) {
    std::vector<std::string> argv = config_.commands.at(name);
    argv.insert(argv.end(), args.begin(), args.end());

    std::string error;
    int status = process::run_foreground(argv, error);
    if (!error.empty()) {
        err_ << "Error: " << error << "\n";
    }
    return status;
}

// ── entry point ─────────────────────────────────────────────

int run(int argc, char **argv) {
    CliOptions options;
    std::string error;

    if (!parse_arguments(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n";
        std::cerr << "Run 'warden help' for usage information\n";
        return 1;
    }

    if (options.log_level) {
        logging::Logger::set_level(logging::string_to_level(*options.log_level));
    }

    runtime::RuntimeConfig config;
    std::error_code ec;
    if (options.config_explicit || std::filesystem::exists(options.config_path, ec)) {
        if (!runtime::load_config(options.config_path, config, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    } else {
        LOG_DEBUG("[CLI] No " << options.config_path << ", using defaults");
    }

    // Command line wins over the config file
    if (!options.log_level) {
        logging::Logger::set_level(logging::string_to_level(config.logging.level));
    }

    process::SystemLivenessProber prober;
    process::SystemProcessSignaller signaller;
    process::DetachedProcessLauncher launcher;
    process::Terminator terminator(prober, signaller,
                                   supervisor::to_termination_policy(config.supervisor.termination));
    state::PidStore pid_store(config.supervisor.pid_file, prober);
    state::LogSink log_sink(config.supervisor.log_file, config.supervisor.worker_name);
    build::CommandBuildStep build_step(config.build.command);

    supervisor::Supervisor supervisor(config.supervisor, pid_store, log_sink, build_step, launcher, terminator,
                                      prober);

    CommandDispatcher dispatcher(config, supervisor, build_step, std::cout, std::cerr);
    return dispatcher.dispatch(options.command, options.args);
}

}  // namespace cli
}  // namespace warden

#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>

#include "logging/logger.hpp"

namespace warden {
namespace runtime {

namespace {

// Accepts either a sequence ([go, build, ./...]) or a scalar ("go build ./...")
std::vector<std::string> parse_argv(const YAML::Node &node) {
    std::vector<std::string> argv;
    if (node.IsSequence()) {
        for (const auto &item : node) {
            argv.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        std::istringstream words(node.as<std::string>());
        std::string word;
        while (words >> word) {
            argv.push_back(word);
        }
    }
    return argv;
}

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid.begin(), valid.end(), key) == valid.end()) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

}  // namespace

const std::vector<std::string> &builtin_commands() {
    static const std::vector<std::string> commands = {"start", "stop",  "status", "log",     "run",
                                                      "build", "clean", "help",   "version"};
    return commands;
}

bool validate_config(const RuntimeConfig &config, std::string &error) {
    const auto &sup = config.supervisor;

    // Worker
    if (sup.executable.empty()) {
        error = "worker.executable must not be empty";
        return false;
    }
    if (sup.worker_name.empty()) {
        error = "worker.name must not be empty";
        return false;
    }
    for (const auto &var : sup.unset_environment) {
        if (var.empty() || var.find('=') != std::string::npos) {
            error = "worker.unset_env entries must be variable names, got '" + var + "'";
            return false;
        }
    }

    // State files
    if (sup.pid_file.empty() || sup.log_file.empty()) {
        error = "state.pid_file and state.log_file must not be empty";
        return false;
    }
    if (sup.pid_file == sup.log_file) {
        error = "state.pid_file and state.log_file must differ";
        return false;
    }

    // Timing
    if (sup.settle_delay_ms < 0) {
        error = "startup.settle_delay_ms must be >= 0";
        return false;
    }
    const auto &term = sup.termination;
    if (term.graceful_timeout_ms <= 0 || term.forceful_timeout_ms <= 0) {
        error = "termination timeouts must be > 0";
        return false;
    }
    if (term.poll_interval_ms <= 0) {
        error = "termination.poll_interval_ms must be > 0";
        return false;
    }
    if (term.poll_interval_ms > term.graceful_timeout_ms || term.poll_interval_ms > term.forceful_timeout_ms) {
        error = "termination.poll_interval_ms must not exceed either timeout";
        return false;
    }

    // Passthrough commands
    const auto &builtins = builtin_commands();
    for (const auto &[name, argv] : config.commands) {
        // commands.clean is the hook `warden clean` runs before removing state
        if (name != "clean" && std::find(builtins.begin(), builtins.end(), name) != builtins.end()) {
            error = "commands." + name + " shadows a built-in command";
            return false;
        }
        if (argv.empty()) {
            error = "commands." + name + " must not be empty";
            return false;
        }
    }

    // Logging
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: all defaults
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "",
                          {"worker", "state", "startup", "termination", "build", "commands", "logging"});

        auto &sup = config.supervisor;

        // Worker
        if (const auto worker = yaml["worker"]) {
            warn_unknown_keys(worker, "worker", {"name", "executable", "unset_env", "default_prompt"});
            if (worker["name"]) {
                sup.worker_name = worker["name"].as<std::string>();
            }
            if (worker["executable"]) {
                sup.executable = worker["executable"].as<std::string>();
            }
            if (worker["unset_env"]) {
                // Scalar or sequence, like build.command
                sup.unset_environment = parse_argv(worker["unset_env"]);
            }
            if (worker["default_prompt"]) {
                sup.default_prompt = worker["default_prompt"].as<std::string>();
            }
        }

        // State files
        if (const auto state = yaml["state"]) {
            warn_unknown_keys(state, "state", {"pid_file", "log_file"});
            if (state["pid_file"]) {
                sup.pid_file = state["pid_file"].as<std::string>();
            }
            if (state["log_file"]) {
                sup.log_file = state["log_file"].as<std::string>();
            }
        }

        // Startup
        if (const auto startup = yaml["startup"]) {
            warn_unknown_keys(startup, "startup", {"settle_delay_ms"});
            if (startup["settle_delay_ms"]) {
                sup.settle_delay_ms = startup["settle_delay_ms"].as<int>();
            }
        }

        // Termination
        if (const auto term = yaml["termination"]) {
            warn_unknown_keys(term, "termination", {"graceful_timeout_ms", "forceful_timeout_ms", "poll_interval_ms"});
            if (term["graceful_timeout_ms"]) {
                sup.termination.graceful_timeout_ms = term["graceful_timeout_ms"].as<int>();
            }
            if (term["forceful_timeout_ms"]) {
                sup.termination.forceful_timeout_ms = term["forceful_timeout_ms"].as<int>();
            }
            if (term["poll_interval_ms"]) {
                sup.termination.poll_interval_ms = term["poll_interval_ms"].as<int>();
            }
        }

        // Build collaborator
        if (const auto build = yaml["build"]) {
            warn_unknown_keys(build, "build", {"command"});
            if (build["command"]) {
                config.build.command = parse_argv(build["command"]);
            }
        }

        // Passthrough commands
        if (const auto commands = yaml["commands"]) {
            if (!commands.IsMap()) {
                error = "commands must be a mapping of name to command";
                return false;
            }
            config.commands.clear();  // Ensure idempotent parsing
            for (const auto &entry : commands) {
                config.commands[entry.first.as<std::string>()] = parse_argv(entry.second);
            }
        }

        // Logging
        if (const auto logging = yaml["logging"]) {
            warn_unknown_keys(logging, "logging", {"level"});
            if (logging["level"]) {
                config.logging.level = logging["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Worker: " << sup.worker_name << " (" << sup.executable << ")");
        LOG_INFO("[Config] State: pid=" << sup.pid_file << " log=" << sup.log_file);
        LOG_INFO("[Config] Termination: graceful " << sup.termination.graceful_timeout_ms << "ms, forceful "
                                                   << sup.termination.forceful_timeout_ms << "ms");
        LOG_INFO("[Config] Build: " << (config.build.command.empty() ? "none" : config.build.command.front()));
        LOG_INFO("[Config] Passthrough commands: " << config.commands.size());

        return true;
    } catch (const YAML::BadFile &) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace warden

#pragma once

#include <map>
#include <string>
#include <vector>

#include "supervisor/supervisor_config.hpp"

namespace warden {
namespace runtime {

constexpr const char *kDefaultConfigPath = "warden.yaml";

struct LoggingConfig {
    std::string level = "warn";  // debug, info, warn, error, none
};

struct BuildConfig {
    std::vector<std::string> command;  // Empty: worker executable is prebuilt
};

struct RuntimeConfig {
    supervisor::SupervisorConfig supervisor;  // worker:, state:, startup:, termination:
    BuildConfig build;
    std::map<std::string, std::vector<std::string>> commands;  // Passthroughs to the collaborator
    LoggingConfig logging;
};

// Loads configuration from a YAML file (keys not present keep their defaults)
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// Commands handled by warden itself; passthroughs may not reuse these names
const std::vector<std::string> &builtin_commands();

}  // namespace runtime
}  // namespace warden

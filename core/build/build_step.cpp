#include "build_step.hpp"

#include <utility>

#include "logging/logger.hpp"
#include "process/command_runner.hpp"

namespace warden {
namespace build {

CommandBuildStep::CommandBuildStep(std::vector<std::string> command) : command_(std::move(command)) {}

int CommandBuildStep::run() {
    if (command_.empty()) {
        LOG_DEBUG("[Build] No build command configured, using existing worker executable");
        return 0;
    }

    std::string error;
    int status = process::run_foreground(command_, error);
    if (status != 0) {
        if (!error.empty()) {
            LOG_ERROR("[Build] " << error);
        }
        LOG_ERROR("[Build] Build failed with exit status " << status);
    } else {
        LOG_INFO("[Build] Build succeeded");
    }
    return status;
}

}  // namespace build
}  // namespace warden

#pragma once

#include <string>
#include <vector>

namespace warden {
namespace build {

// Interface for the external build collaborator to enable mocking.
// The collaborator produces the worker executable or fails with its own
// exit status, which warden propagates unchanged.
class IBuildStep {
public:
    virtual ~IBuildStep() = default;

    // Returns 0 on success, otherwise the collaborator's exit status
    virtual int run() = 0;
};

// Runs the configured build command in the foreground.
// An empty command means the worker is prebuilt; run() succeeds immediately.
class CommandBuildStep : public IBuildStep {
public:
    explicit CommandBuildStep(std::vector<std::string> command);

    int run() override;

    const std::vector<std::string> &command() const { return command_; }

private:
    std::vector<std::string> command_;
};

}  // namespace build
}  // namespace warden

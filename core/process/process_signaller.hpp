#pragma once

#include "process_types.hpp"

namespace warden {
namespace process {

enum class SignalResult {
    DELIVERED,        // Request accepted by the OS
    NO_SUCH_PROCESS,  // Target vanished before delivery
    FAILED            // Delivery refused (e.g. permission denied)
};

// Interface for stop requests to enable mocking
class IProcessSignaller {
public:
    virtual ~IProcessSignaller() = default;

    // Interceptible stop request (SIGTERM; CTRL_BREAK on Windows)
    virtual SignalResult request_stop(ProcessId pid) = 0;

    // Uninterceptible termination (SIGKILL; TerminateProcess on Windows)
    virtual SignalResult force_kill(ProcessId pid) = 0;
};

class SystemProcessSignaller : public IProcessSignaller {
public:
    SignalResult request_stop(ProcessId pid) override;
    SignalResult force_kill(ProcessId pid) override;
};

const char *signal_result_to_string(SignalResult result);

}  // namespace process
}  // namespace warden

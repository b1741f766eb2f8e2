#pragma once

#include <chrono>
#include <functional>

#include "liveness_prober.hpp"
#include "process_signaller.hpp"
#include "process_types.hpp"

namespace warden {
namespace process {

struct TerminationPolicy {
    std::chrono::milliseconds graceful_timeout{10000};  // Wait after the stop request
    std::chrono::milliseconds forceful_timeout{5000};   // Wait after the forced kill
    std::chrono::milliseconds poll_interval{100};       // Liveness polling granularity
};

enum class TerminationOutcome {
    STOPPED_GRACEFULLY,  // Exited within graceful_timeout of the stop request
    STOPPED_FORCEFULLY,  // Exited after the forced kill
    ALREADY_GONE,        // Not alive before we started, or vanished during signal delivery
    STILL_RUNNING        // Survived both phases (e.g. uninterruptible sleep, no permission)
};

// Terminator stops a process with bounded escalation:
//   GRACEFUL: request_stop, wait up to graceful_timeout
//   FORCEFUL: force_kill,   wait up to forceful_timeout
//   DONE
// Time spent sleeping never exceeds graceful_timeout + forceful_timeout.
class Terminator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // sleeper defaults to std::this_thread::sleep_for; tests inject a fake.
    Terminator(const ILivenessProber &prober, IProcessSignaller &signaller, TerminationPolicy policy = {},
               Sleeper sleeper = nullptr);

    TerminationOutcome stop(ProcessId pid);

    const TerminationPolicy &policy() const { return policy_; }

private:
    enum class Phase { GRACEFUL, FORCEFUL, DONE };

    // Polls liveness until the process is gone or timeout elapses.
    // Elapsed time is accumulated from the sleeper calls, not a wall clock.
    bool wait_for_exit(ProcessId pid, std::chrono::milliseconds timeout);

    const ILivenessProber &prober_;
    IProcessSignaller &signaller_;
    TerminationPolicy policy_;
    Sleeper sleeper_;
};

const char *termination_outcome_to_string(TerminationOutcome outcome);

}  // namespace process
}  // namespace warden

#include "terminator.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include "logging/logger.hpp"

namespace warden {
namespace process {

Terminator::Terminator(const ILivenessProber &prober, IProcessSignaller &signaller, TerminationPolicy policy,
                       Sleeper sleeper)
    : prober_(prober), signaller_(signaller), policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (policy_.poll_interval.count() <= 0) {
        policy_.poll_interval = std::chrono::milliseconds(1);
    }
}

TerminationOutcome Terminator::stop(ProcessId pid) {
    if (!prober_.is_alive(pid)) {
        LOG_INFO("[Terminator] pid " << pid << " already gone");
        return TerminationOutcome::ALREADY_GONE;
    }

    Phase phase = Phase::GRACEFUL;
    TerminationOutcome outcome = TerminationOutcome::STILL_RUNNING;

    while (phase != Phase::DONE) {
        switch (phase) {
            case Phase::GRACEFUL: {
                LOG_INFO("[Terminator] Requesting stop of pid " << pid);
                SignalResult sent = signaller_.request_stop(pid);
                if (sent == SignalResult::NO_SUCH_PROCESS) {
                    outcome = TerminationOutcome::ALREADY_GONE;
                    phase = Phase::DONE;
                    break;
                }
                // FAILED still waits: the process may exit on its own, and the
                // forced kill below is the fallback either way.
                if (wait_for_exit(pid, policy_.graceful_timeout)) {
                    LOG_INFO("[Terminator] pid " << pid << " exited after stop request");
                    outcome = TerminationOutcome::STOPPED_GRACEFULLY;
                    phase = Phase::DONE;
                } else {
                    LOG_WARN("[Terminator] pid " << pid << " still alive after "
                                                 << policy_.graceful_timeout.count() << "ms, escalating");
                    phase = Phase::FORCEFUL;
                }
                break;
            }
            case Phase::FORCEFUL: {
                SignalResult sent = signaller_.force_kill(pid);
                if (sent == SignalResult::NO_SUCH_PROCESS) {
                    outcome = TerminationOutcome::ALREADY_GONE;
                } else if (wait_for_exit(pid, policy_.forceful_timeout)) {
                    LOG_INFO("[Terminator] pid " << pid << " killed");
                    outcome = TerminationOutcome::STOPPED_FORCEFULLY;
                } else {
                    LOG_ERROR("[Terminator] pid " << pid << " survived forced kill ("
                                                  << signal_result_to_string(sent) << ")");
                    outcome = TerminationOutcome::STILL_RUNNING;
                }
                phase = Phase::DONE;
                break;
            }
            case Phase::DONE:
                break;
        }
    }

    return outcome;
}

bool Terminator::wait_for_exit(ProcessId pid, std::chrono::milliseconds timeout) {
    std::chrono::milliseconds waited{0};
    while (true) {
        if (!prober_.is_alive(pid)) {
            return true;
        }
        if (waited >= timeout) {
            return false;
        }
        auto step = std::min(policy_.poll_interval, timeout - waited);
        sleeper_(step);
        waited += step;
    }
}

const char *termination_outcome_to_string(TerminationOutcome outcome) {
    switch (outcome) {
        case TerminationOutcome::STOPPED_GRACEFULLY:
            return "STOPPED_GRACEFULLY";
        case TerminationOutcome::STOPPED_FORCEFULLY:
            return "STOPPED_FORCEFULLY";
        case TerminationOutcome::ALREADY_GONE:
            return "ALREADY_GONE";
        case TerminationOutcome::STILL_RUNNING:
            return "STILL_RUNNING";
        default:
            return "UNKNOWN";
    }
}

}  // namespace process
}  // namespace warden

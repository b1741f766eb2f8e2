#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "build/build_step.hpp"
#include "process/liveness_prober.hpp"
#include "process/process_launcher.hpp"
#include "process/process_types.hpp"
#include "process/terminator.hpp"
#include "state/log_sink.hpp"
#include "state/pid_store.hpp"
#include "supervisor_config.hpp"

namespace warden {
namespace supervisor {

enum class StartOutcome {
    STARTED,          // Spawned and still alive after the settle delay
    ALREADY_RUNNING,  // A valid tracked instance exists; nothing was built or spawned
    EXITED_EARLY,     // Spawned but dead by the settle check; see the log
    BUILD_FAILED,     // Collaborator failed; build_status holds its exit status
    SPAWN_FAILED      // Log, spawn or record failure; error holds the reason
};

struct StartResult {
    StartOutcome outcome = StartOutcome::SPAWN_FAILED;
    std::optional<process::ProcessId> pid;  // New pid, or the existing one for ALREADY_RUNNING
    int build_status = 0;
    std::string error;
};

enum class StopOutcome {
    STOPPED,          // Exited after the stop request or the forced kill
    ALREADY_GONE,     // Vanished before or during termination
    NOTHING_TO_STOP,  // No valid tracked instance
    STILL_RUNNING     // Survived both escalation phases
};

struct StopResult {
    StopOutcome outcome = StopOutcome::NOTHING_TO_STOP;
    std::optional<process::ProcessId> pid;
    std::optional<process::TerminationOutcome> termination;
};

enum class CleanOutcome {
    CLEANED,          // Record and log removed
    REFUSED_RUNNING,  // A valid instance is running; nothing removed
    FAILED            // Log could not be removed; error says why
};

// The single supervised instance, as seen by status
struct TrackedProcess {
    process::ProcessId pid = 0;
    std::string log_path;
    std::optional<std::string> started_at;  // From the log session header; informational
};

struct StatusReport {
    std::optional<TrackedProcess> tracked;  // nullopt: not running
    std::string log_path;

    bool running() const { return tracked.has_value(); }
};

// Supervisor composes the lifecycle pieces into start/stop/status/log and is
// the only place that decides whether a tracked instance is valid.
//
// Instance states: Absent -> Starting -> Running -> Stopping -> Absent.
// Validity is always re-derived from the PID record plus a liveness probe,
// so an instance that died on its own is simply Absent on the next call.
class Supervisor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Supervisor(SupervisorConfig config, state::PidStore &pid_store, state::LogSink &log_sink,
               build::IBuildStep &build_step, process::IProcessLauncher &launcher, process::Terminator &terminator,
               const process::ILivenessProber &prober, Sleeper sleeper = nullptr);

    // Rejects (ALREADY_RUNNING) if a valid instance exists. Otherwise builds,
    // starts a fresh log session, launches `<executable> [extra_flags...] <prompt>`,
    // records the pid, waits settle_delay_ms and re-probes.
    StartResult start(const std::string &prompt, const std::vector<std::string> &extra_flags = {});

    // Terminates the tracked instance and always clears the record afterwards.
    StopResult stop();

    // Read-only projection of the PID Store; no side effects.
    StatusReport status() const;

    // Log Sink contents, or std::nullopt if no session was ever started.
    std::optional<std::string> log() const;

    // Removes the PID record and the Log Sink unless an instance is running.
    CleanOutcome clean(std::string &error);

    // Builds, then runs the worker attached to the caller's terminal and
    // returns its exit status. Bypasses the PID Store and the Log Sink.
    int run_in_foreground(const std::string &prompt, const std::vector<std::string> &extra_flags,
                          std::string &error);

    const SupervisorConfig &config() const { return config_; }

private:
    SupervisorConfig config_;
    state::PidStore &pid_store_;
    state::LogSink &log_sink_;
    build::IBuildStep &build_step_;
    process::IProcessLauncher &launcher_;
    process::Terminator &terminator_;
    const process::ILivenessProber &prober_;
    Sleeper sleeper_;
};

// Worker argv after the executable: extra flags in order, prompt last.
std::vector<std::string> build_worker_arguments(const std::vector<std::string> &extra_flags,
                                                const std::string &prompt);

process::TerminationPolicy to_termination_policy(const TerminationConfig &config);

const char *start_outcome_to_string(StartOutcome outcome);
const char *stop_outcome_to_string(StopOutcome outcome);
const char *clean_outcome_to_string(CleanOutcome outcome);

}  // namespace supervisor
}  // namespace warden

#include "supervisor.hpp"

#include <thread>
#include <utility>

#include "logging/logger.hpp"
#include "process/command_runner.hpp"

namespace warden {
namespace supervisor {

Supervisor::Supervisor(SupervisorConfig config, state::PidStore &pid_store, state::LogSink &log_sink,
                       build::IBuildStep &build_step, process::IProcessLauncher &launcher,
                       process::Terminator &terminator, const process::ILivenessProber &prober, Sleeper sleeper)
    : config_(std::move(config)),
      pid_store_(pid_store),
      log_sink_(log_sink),
      build_step_(build_step),
      launcher_(launcher),
      terminator_(terminator),
      prober_(prober),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

StartResult Supervisor::start(const std::string &prompt, const std::vector<std::string> &extra_flags) {
    StartResult result;

    if (auto existing = pid_store_.read()) {
        LOG_INFO("[Supervisor] " << config_.worker_name << " already running (PID=" << *existing << ")");
        result.outcome = StartOutcome::ALREADY_RUNNING;
        result.pid = existing;
        return result;
    }

    // Absent -> Starting
    int build_status = build_step_.run();
    if (build_status != 0) {
        result.outcome = StartOutcome::BUILD_FAILED;
        result.build_status = build_status;
        result.error = "Build failed with exit status " + std::to_string(build_status);
        return result;
    }

    std::optional<state::LogSession> session = log_sink_.begin_session(result.error);
    if (!session) {
        LOG_ERROR("[Supervisor] " << result.error);
        result.outcome = StartOutcome::SPAWN_FAILED;
        return result;
    }

    process::LaunchRequest request;
    request.executable = config_.executable;
    request.arguments = build_worker_arguments(extra_flags, prompt);
    request.unset_environment = config_.unset_environment;
    request.output = session->handle();

    std::optional<process::ProcessId> pid = launcher_.launch(request, result.error);
    // The worker holds its own copy of the handle
    session->close();

    if (!pid) {
        result.outcome = StartOutcome::SPAWN_FAILED;
        return result;
    }
    result.pid = pid;

    std::string record_error;
    if (!pid_store_.write(*pid, record_error)) {
        // An unrecorded worker could never be stopped through warden
        LOG_ERROR("[Supervisor] " << record_error << "; stopping untracked worker " << *pid);
        process::TerminationOutcome rollback = terminator_.stop(*pid);
        LOG_INFO("[Supervisor] Rollback of pid " << *pid << ": " << process::termination_outcome_to_string(rollback));
        result.outcome = StartOutcome::SPAWN_FAILED;
        result.error = "Failed to record worker pid: " + record_error;
        return result;
    }

    LOG_INFO("[Supervisor] Waiting " << config_.settle_delay_ms << "ms for " << config_.worker_name
                                     << " (PID=" << *pid << ") to settle");
    if (config_.settle_delay_ms > 0) {
        sleeper_(std::chrono::milliseconds(config_.settle_delay_ms));
    }

    // Starting -> Running, or straight back to Absent
    if (prober_.is_alive(*pid)) {
        result.outcome = StartOutcome::STARTED;
    } else {
        LOG_WARN("[Supervisor] " << config_.worker_name << " (PID=" << *pid << ") exited during startup");
        result.outcome = StartOutcome::EXITED_EARLY;
    }
    return result;
}

StopResult Supervisor::stop() {
    StopResult result;

    auto pid = pid_store_.read();
    if (!pid) {
        result.outcome = StopOutcome::NOTHING_TO_STOP;
        return result;
    }
    result.pid = pid;

    // Running -> Stopping -> Absent
    process::TerminationOutcome termination = terminator_.stop(*pid);
    result.termination = termination;

    // The record is stale whatever the outcome
    pid_store_.clear();

    switch (termination) {
        case process::TerminationOutcome::STOPPED_GRACEFULLY:
        case process::TerminationOutcome::STOPPED_FORCEFULLY:
            result.outcome = StopOutcome::STOPPED;
            break;
        case process::TerminationOutcome::ALREADY_GONE:
            result.outcome = StopOutcome::ALREADY_GONE;
            break;
        case process::TerminationOutcome::STILL_RUNNING:
            result.outcome = StopOutcome::STILL_RUNNING;
            break;
    }
    return result;
}

StatusReport Supervisor::status() const {
    StatusReport report;
    report.log_path = log_sink_.path();

    if (auto pid = pid_store_.read()) {
        TrackedProcess tracked;
        tracked.pid = *pid;
        tracked.log_path = log_sink_.path();
        tracked.started_at = log_sink_.session_started_at();
        report.tracked = tracked;
    }
    return report;
}

std::optional<std::string> Supervisor::log() const { return log_sink_.read(); }

CleanOutcome Supervisor::clean(std::string &error) {
    if (auto pid = pid_store_.read()) {
        // Deleting the record would orphan the worker
        LOG_WARN("[Supervisor] Not cleaning: " << config_.worker_name << " is running (PID=" << *pid << ")");
        return CleanOutcome::REFUSED_RUNNING;
    }

    pid_store_.clear();
    if (!log_sink_.remove(error)) {
        LOG_ERROR("[Supervisor] " << error);
        return CleanOutcome::FAILED;
    }
    return CleanOutcome::CLEANED;
}

int Supervisor::run_in_foreground(const std::string &prompt, const std::vector<std::string> &extra_flags,
                                  std::string &error) {
    int build_status = build_step_.run();
    if (build_status != 0) {
        error = "Build failed with exit status " + std::to_string(build_status);
        return build_status;
    }

    std::vector<std::string> argv{config_.executable};
    for (auto &arg : build_worker_arguments(extra_flags, prompt)) {
        argv.push_back(std::move(arg));
    }
    return process::run_foreground(argv, error, config_.unset_environment);
}

std::vector<std::string> build_worker_arguments(const std::vector<std::string> &extra_flags,
                                                const std::string &prompt) {
    std::vector<std::string> args(extra_flags);
    args.push_back(prompt);
    return args;
}

process::TerminationPolicy to_termination_policy(const TerminationConfig &config) {
    process::TerminationPolicy policy;
    policy.graceful_timeout = std::chrono::milliseconds(config.graceful_timeout_ms);
    policy.forceful_timeout = std::chrono::milliseconds(config.forceful_timeout_ms);
    policy.poll_interval = std::chrono::milliseconds(config.poll_interval_ms);
    return policy;
}

const char *start_outcome_to_string(StartOutcome outcome) {
    switch (outcome) {
        case StartOutcome::STARTED:
            return "STARTED";
        case StartOutcome::ALREADY_RUNNING:
            return "ALREADY_RUNNING";
        case StartOutcome::EXITED_EARLY:
            return "EXITED_EARLY";
        case StartOutcome::BUILD_FAILED:
            return "BUILD_FAILED";
        case StartOutcome::SPAWN_FAILED:
            return "SPAWN_FAILED";
        default:
            return "UNKNOWN";
    }
}

const char *clean_outcome_to_string(CleanOutcome outcome) {
    switch (outcome) {
        case CleanOutcome::CLEANED:
            return "CLEANED";
        case CleanOutcome::REFUSED_RUNNING:
            return "REFUSED_RUNNING";
        case CleanOutcome::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

const char *stop_outcome_to_string(StopOutcome outcome) {
    switch (outcome) {
        case StopOutcome::STOPPED:
            return "STOPPED";
        case StopOutcome::ALREADY_GONE:
            return "ALREADY_GONE";
        case StopOutcome::NOTHING_TO_STOP:
            return "NOTHING_TO_STOP";
        case StopOutcome::STILL_RUNNING:
            return "STILL_RUNNING";
        default:
            return "UNKNOWN";
    }
}

}  // namespace supervisor
}  // namespace warden

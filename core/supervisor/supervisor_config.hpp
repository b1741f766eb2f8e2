#pragma once

#include <string>
#include <vector>

namespace warden {
namespace supervisor {

struct TerminationConfig {
    int graceful_timeout_ms = 10000;  // Wait after the stop request before escalating
    int forceful_timeout_ms = 5000;   // Wait after the forced kill
    int poll_interval_ms = 100;       // Liveness polling granularity during both waits
};

struct SupervisorConfig {
    std::string worker_name = "worker";                      // Used in the log header and messages
    std::string executable = "./worker";                     // Produced by the build collaborator
    std::vector<std::string> unset_environment{"CLAUDECODE"};  // Stripped from the worker's environment
    std::string default_prompt = "What is 2+2?";             // Used by `run` when no prompt is given
    std::string pid_file = ".warden.pid";
    std::string log_file = ".warden.log";
    int settle_delay_ms = 2000;  // Delay before the post-launch liveness check
    TerminationConfig termination;
};

}  // namespace supervisor
}  // namespace warden

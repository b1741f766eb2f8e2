#include "process_signaller.hpp"

#include <cstring>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#endif

namespace warden {
namespace process {

namespace {

#ifndef _WIN32
SignalResult send_signal(ProcessId pid, int signo) {
    if (pid <= 0) {
        return SignalResult::NO_SUCH_PROCESS;
    }
    if (kill(static_cast<pid_t>(pid), signo) == 0) {
        return SignalResult::DELIVERED;
    }
    if (errno == ESRCH) {
        return SignalResult::NO_SUCH_PROCESS;
    }
    LOG_WARN("[Signaller] kill(" << pid << ", " << signo << ") failed: " << std::strerror(errno));
    return SignalResult::FAILED;
}
#endif

}  // namespace

SignalResult SystemProcessSignaller::request_stop(ProcessId pid) {
#ifdef _WIN32
    if (pid <= 0) {
        return SignalResult::NO_SUCH_PROCESS;
    }
    // The worker was started with CREATE_NEW_PROCESS_GROUP, so its pid is
    // also its group id. CTRL_C is disabled for new groups; CTRL_BREAK is not.
    if (GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, static_cast<DWORD>(pid))) {
        return SignalResult::DELIVERED;
    }
    DWORD err = GetLastError();
    if (err == ERROR_INVALID_PARAMETER) {
        return SignalResult::NO_SUCH_PROCESS;
    }
    LOG_WARN("[Signaller] GenerateConsoleCtrlEvent(" << pid << ") failed: " << err);
    return SignalResult::FAILED;
#else
    return send_signal(pid, SIGTERM);
#endif
}

SignalResult SystemProcessSignaller::force_kill(ProcessId pid) {
#ifdef _WIN32
    if (pid <= 0) {
        return SignalResult::NO_SUCH_PROCESS;
    }
    HANDLE handle = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(pid));
    if (!handle) {
        DWORD err = GetLastError();
        if (err == ERROR_INVALID_PARAMETER) {
            return SignalResult::NO_SUCH_PROCESS;
        }
        LOG_WARN("[Signaller] OpenProcess(" << pid << ") failed: " << err);
        return SignalResult::FAILED;
    }
    BOOL ok = TerminateProcess(handle, 1);
    DWORD err = ok ? 0 : GetLastError();
    CloseHandle(handle);
    if (ok) {
        return SignalResult::DELIVERED;
    }
    // TerminateProcess on an already-exited process fails with access denied
    LOG_WARN("[Signaller] TerminateProcess(" << pid << ") failed: " << err);
    return SignalResult::FAILED;
#else
    return send_signal(pid, SIGKILL);
#endif
}

const char *signal_result_to_string(SignalResult result) {
    switch (result) {
        case SignalResult::DELIVERED:
            return "DELIVERED";
        case SignalResult::NO_SUCH_PROCESS:
            return "NO_SUCH_PROCESS";
        case SignalResult::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace process
}  // namespace warden

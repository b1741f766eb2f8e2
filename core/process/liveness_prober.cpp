#include "liveness_prober.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/types.h>
#if defined(__APPLE__)
#include <sys/sysctl.h>
#endif
#endif

namespace warden {
namespace process {

namespace {

#if defined(__linux__)
// Returns the single-char state from /proc/<pid>/stat, or '\0' if the entry
// does not exist or cannot be read.
// Format: "<pid> (<comm>) <state> ...". comm may contain spaces and ')' so
// the state is located after the LAST ')'.
char read_proc_state(ProcessId pid) {
    std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
    if (!stat_file.is_open()) {
        return '\0';
    }

    std::string content;
    std::getline(stat_file, content);

    auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos) {
        return '\0';
    }

    std::istringstream rest(content.substr(close_paren + 1));
    char state = '\0';
    rest >> state;
    return state;
}
#endif

}  // namespace

bool SystemLivenessProber::is_alive(ProcessId pid) const {
    if (pid <= 0) {
        return false;
    }

#ifdef _WIN32
    if (pid > static_cast<ProcessId>((std::numeric_limits<DWORD>::max)())) {
        return false;
    }

    HANDLE handle = OpenProcess(SYNCHRONIZE | PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!handle) {
        // ERROR_INVALID_PARAMETER (no such pid) or ERROR_ACCESS_DENIED
        return false;
    }

    // A signalled process handle means the process has exited; the kernel
    // object lingers only while someone holds a handle, like a zombie.
    DWORD wait_result = WaitForSingleObject(handle, 0);
    CloseHandle(handle);
    return wait_result == WAIT_TIMEOUT;
#else
    if (pid > static_cast<ProcessId>((std::numeric_limits<pid_t>::max)())) {
        return false;
    }

#if defined(__linux__)
    char state = read_proc_state(pid);
    if (state == '\0') {
        return false;
    }
    if (state == 'Z' || state == 'X' || state == 'x') {
        LOG_DEBUG("[Liveness] pid " << pid << " is defunct (state " << state << ")");
        return false;
    }
    return true;
#elif defined(__APPLE__)
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PID, static_cast<int>(pid)};
    struct kinfo_proc info;
    size_t size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) != 0 || size == 0) {
        return false;
    }
    if (info.kp_proc.p_stat == SZOMB) {
        LOG_DEBUG("[Liveness] pid " << pid << " is a zombie");
        return false;
    }
    return true;
#else
    // No portable process-state query; existence check only.
    // EPERM (exists, not ours) is reported as not alive.
    return kill(static_cast<pid_t>(pid), 0) == 0;
#endif
#endif
}

}  // namespace process
}  // namespace warden

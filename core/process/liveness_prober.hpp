#pragma once

#include "process_types.hpp"

namespace warden {
namespace process {

// Interface for liveness queries to enable mocking
class ILivenessProber {
public:
    virtual ~ILivenessProber() = default;

    // True only if a process table entry exists for pid and it is not a
    // zombie/defunct entry. Never throws: unknown pid, permission denied and
    // zombies all report false.
    virtual bool is_alive(ProcessId pid) const = 0;
};

// Inspects the OS process table.
// - Linux: /proc/<pid>/stat state field (Z and X are dead)
// - macOS: sysctl(KERN_PROC_PID), p_stat != SZOMB
// - other POSIX: kill(pid, 0)
// - Windows: OpenProcess + WaitForSingleObject(0)
class SystemLivenessProber : public ILivenessProber {
public:
    bool is_alive(ProcessId pid) const override;
};

}  // namespace process
}  // namespace warden

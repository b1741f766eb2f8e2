#pragma once

#include <optional>
#include <string>

#include "process/liveness_prober.hpp"
#include "process/process_types.hpp"

namespace warden {
namespace state {

// PidStore persists the single tracked worker pid as plain text at a fixed path.
// A record only counts when it parses as a positive integer AND the prober
// confirms the pid is alive; anything else reads as "no instance".
// There is no cross-invocation locking: concurrent warden invocations against
// the same file race.
class PidStore {
public:
    PidStore(std::string path, const process::ILivenessProber &prober);

    // Tracked pid if the record exists, parses, and names a live process.
    // Missing file, garbage, I/O errors and dead pids all return std::nullopt.
    std::optional<process::ProcessId> read() const;

    // Raw parsed record without the liveness check (nullopt if absent/corrupt).
    std::optional<process::ProcessId> read_record() const;

    // Overwrites the record. Returns false and sets error on I/O failure.
    bool write(process::ProcessId pid, std::string &error);

    // Removes the record. Clearing an absent record is not an error.
    void clear();

    const std::string &path() const { return path_; }

private:
    std::string path_;
    const process::ILivenessProber &prober_;
};

// Parses a pid record ("1234", "1234\n", "  1234 ").
// Returns std::nullopt for anything that is not a single positive integer.
std::optional<process::ProcessId> parse_pid(const std::string &text);

}  // namespace state
}  // namespace warden

#include "pid_store.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace fs = std::filesystem;

namespace warden {
namespace state {

std::optional<process::ProcessId> parse_pid(const std::string &text) {
    const char *whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = text.find_last_not_of(whitespace);

    const char *begin = text.data() + first;
    const char *end = text.data() + last + 1;

    process::ProcessId value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value <= 0) {
        return std::nullopt;
    }
    return value;
}

PidStore::PidStore(std::string path, const process::ILivenessProber &prober)
    : path_(std::move(path)), prober_(prober) {}

std::optional<process::ProcessId> PidStore::read_record() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LOG_WARN("[PidStore] Failed to read " << path_);
        return std::nullopt;
    }

    auto pid = parse_pid(buffer.str());
    if (!pid) {
        LOG_DEBUG("[PidStore] Ignoring unparseable record in " << path_);
    }
    return pid;
}

std::optional<process::ProcessId> PidStore::read() const {
    auto pid = read_record();
    if (!pid) {
        return std::nullopt;
    }

    if (!prober_.is_alive(*pid)) {
        LOG_DEBUG("[PidStore] Stale record: pid " << *pid << " is not alive");
        return std::nullopt;
    }

    return pid;
}

bool PidStore::write(process::ProcessId pid, std::string &error) {
    // Write-then-rename so a reader never sees a half-written record
    fs::path target(path_);
    fs::path temp = target;
    temp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Failed to create directory for " + path_ + ": " + ec.message();
            return false;
        }
    }

    {
        std::ofstream file(temp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            error = "Failed to open " + temp.string() + " for writing";
            return false;
        }
        file << pid << "\n";
        file.flush();
        if (!file) {
            error = "Failed to write " + temp.string();
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        error = "Failed to move " + temp.string() + " to " + path_ + ": " + ec.message();
        fs::remove(temp, ec);
        return false;
    }

    LOG_DEBUG("[PidStore] Recorded pid " << pid << " in " << path_);
    return true;
}

void PidStore::clear() {
    std::error_code ec;
    if (fs::remove(path_, ec)) {
        LOG_DEBUG("[PidStore] Removed " << path_);
    } else if (ec) {
        LOG_WARN("[PidStore] Failed to remove " << path_ << ": " << ec.message());
    }
}

}  // namespace state
}  // namespace warden

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "process/process_types.hpp"

namespace warden {
namespace state {

// LogSession owns the append handle the worker's output is redirected to.
// Move-only; the handle is closed on destruction. Closing the parent's copy
// does not affect the worker, which holds its own duplicate.
class LogSession {
public:
    LogSession() = default;
    explicit LogSession(process::NativeHandle handle);
    ~LogSession();

    LogSession(const LogSession &) = delete;
    LogSession &operator=(const LogSession &) = delete;
    LogSession(LogSession &&other) noexcept;
    LogSession &operator=(LogSession &&other) noexcept;

    process::NativeHandle handle() const { return handle_; }
    bool is_open() const { return handle_ != process::kInvalidHandle; }
    void close();

private:
    process::NativeHandle handle_ = process::kInvalidHandle;
};

// LogSink is the single file capturing the worker's merged stdout/stderr.
// Each start truncates it and writes a session header:
//   === <name> started at <YYYY-mm-dd HH:MM:SS> ===
//   <blank line>
// status/stop/log never truncate it.
class LogSink {
public:
    LogSink(std::string path, std::string session_name);

    // Truncate, write the header, and return an append handle for the worker.
    // Returns std::nullopt and sets error if the file cannot be opened/written.
    std::optional<LogSession> begin_session(std::string &error);
    std::optional<LogSession> begin_session(std::chrono::system_clock::time_point started_at, std::string &error);

    // Full contents with invalid UTF-8 replaced by U+FFFD.
    // std::nullopt if the sink was never created.
    std::optional<std::string> read() const;

    // Timestamp from the current session header, if present.
    std::optional<std::string> session_started_at() const;

    bool exists() const;

    // Deletes the sink. Returns false and sets error on failure; a missing sink is fine.
    bool remove(std::string &error);

    const std::string &path() const { return path_; }
    const std::string &session_name() const { return session_name_; }

private:
    std::string path_;
    std::string session_name_;
};

// "=== <name> started at <local time> ===\n\n"
std::string format_session_header(const std::string &session_name,
                                  std::chrono::system_clock::time_point started_at);

// Decodes bytes permissively: every maximal invalid UTF-8 subsequence
// becomes U+FFFD. Valid input is returned unchanged.
std::string sanitize_utf8(const std::string &bytes);

}  // namespace state
}  // namespace warden

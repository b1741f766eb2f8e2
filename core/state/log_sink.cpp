#include "log_sink.hpp"

#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace warden {
namespace state {

namespace {

const char *kHeaderPrefix = "=== ";
const char *kHeaderStartedAt = " started at ";
const char *kHeaderSuffix = " ===";

void close_handle(process::NativeHandle handle) {
#ifdef _WIN32
    CloseHandle(static_cast<HANDLE>(handle));
#else
    ::close(handle);
#endif
}

}  // namespace

// LogSession

LogSession::LogSession(process::NativeHandle handle) : handle_(handle) {}

LogSession::~LogSession() { close(); }

LogSession::LogSession(LogSession &&other) noexcept : handle_(other.handle_) {
    other.handle_ = process::kInvalidHandle;
}

LogSession &LogSession::operator=(LogSession &&other) noexcept {
    if (this != &other) {
        close();
        handle_ = other.handle_;
        other.handle_ = process::kInvalidHandle;
    }
    return *this;
}

void LogSession::close() {
    if (handle_ != process::kInvalidHandle) {
        close_handle(handle_);
        handle_ = process::kInvalidHandle;
    }
}

// LogSink

LogSink::LogSink(std::string path, std::string session_name)
    : path_(std::move(path)), session_name_(std::move(session_name)) {}

std::optional<LogSession> LogSink::begin_session(std::string &error) {
    return begin_session(std::chrono::system_clock::now(), error);
}

std::optional<LogSession> LogSink::begin_session(std::chrono::system_clock::time_point started_at,
                                                 std::string &error) {
    std::string header = format_session_header(session_name_, started_at);

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Failed to create directory for " + path_ + ": " + ec.message();
            return std::nullopt;
        }
    }

#ifdef _WIN32
    // Truncate and write the header, then reopen append-only for the worker
    HANDLE truncating = CreateFileA(path_.c_str(), GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_WRITE, NULL,
                                    CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, NULL);
    if (truncating == INVALID_HANDLE_VALUE) {
        error = "Failed to open log " + path_ + ": " + std::to_string(GetLastError());
        return std::nullopt;
    }
    DWORD written = 0;
    BOOL ok = WriteFile(truncating, header.data(), static_cast<DWORD>(header.size()), &written, NULL);
    CloseHandle(truncating);
    if (!ok || written != header.size()) {
        error = "Failed to write log header to " + path_;
        return std::nullopt;
    }

    HANDLE append = CreateFileA(path_.c_str(), FILE_APPEND_DATA | SYNCHRONIZE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, NULL, OPEN_EXISTING,
                                FILE_ATTRIBUTE_NORMAL, NULL);
    if (append == INVALID_HANDLE_VALUE) {
        error = "Failed to reopen log " + path_ + " for append: " + std::to_string(GetLastError());
        return std::nullopt;
    }
    LOG_DEBUG("[LogSink] Session started in " << path_);
    return LogSession(static_cast<process::NativeHandle>(append));
#else
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = "Failed to open log " + path_ + ": " + std::strerror(errno);
        return std::nullopt;
    }
    LogSession session(fd);

    size_t offset = 0;
    while (offset < header.size()) {
        ssize_t n = ::write(fd, header.data() + offset, header.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = "Failed to write log header to " + path_ + ": " + std::strerror(errno);
            return std::nullopt;
        }
        offset += static_cast<size_t>(n);
    }

    LOG_DEBUG("[LogSink] Session started in " << path_);
    return std::optional<LogSession>(std::move(session));
#endif
}

std::optional<std::string> LogSink::read() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LOG_WARN("[LogSink] Error while reading " << path_ << ", returning partial contents");
    }
    return sanitize_utf8(buffer.str());
}

std::optional<std::string> LogSink::session_started_at() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(file, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.rfind(kHeaderPrefix, 0) != 0) {
        return std::nullopt;
    }
    auto at = line.rfind(kHeaderStartedAt);
    size_t suffix_len = std::strlen(kHeaderSuffix);
    if (at == std::string::npos || line.size() < suffix_len ||
        line.compare(line.size() - suffix_len, suffix_len, kHeaderSuffix) != 0) {
        return std::nullopt;
    }

    size_t begin = at + std::strlen(kHeaderStartedAt);
    size_t end = line.size() - suffix_len;
    if (begin >= end) {
        return std::nullopt;
    }
    return line.substr(begin, end - begin);
}

bool LogSink::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

bool LogSink::remove(std::string &error) {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        error = "Failed to remove " + path_ + ": " + ec.message();
        return false;
    }
    return true;
}

std::string format_session_header(const std::string &session_name,
                                  std::chrono::system_clock::time_point started_at) {
    auto time = std::chrono::system_clock::to_time_t(started_at);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream out;
    out << kHeaderPrefix << session_name << kHeaderStartedAt << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << kHeaderSuffix << "\n\n";
    return out.str();
}

std::string sanitize_utf8(const std::string &bytes) {
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    const auto *data = reinterpret_cast<const unsigned char *>(bytes.data());
    size_t size = bytes.size();
    size_t i = 0;

    while (i < size) {
        unsigned char lead = data[i];
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        // Expected length and the valid range of the first continuation byte
        // (excludes overlongs, surrogates and code points above U+10FFFF).
        size_t length = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead == 0xE0) {
            length = 3;
            lo = 0xA0;
        } else if (lead >= 0xE1 && lead <= 0xEC) {
            length = 3;
        } else if (lead == 0xED) {
            length = 3;
            hi = 0x9F;
        } else if (lead >= 0xEE && lead <= 0xEF) {
            length = 3;
        } else if (lead == 0xF0) {
            length = 4;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            length = 4;
        } else if (lead == 0xF4) {
            length = 4;
            hi = 0x8F;
        }

        if (length == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t consumed = 1;
        while (consumed < length && i + consumed < size) {
            unsigned char c = data[i + consumed];
            unsigned char min = consumed == 1 ? lo : 0x80;
            unsigned char max = consumed == 1 ? hi : 0xBF;
            if (c < min || c > max) {
                break;
            }
            ++consumed;
        }

        if (consumed == length) {
            out.append(bytes, i, length);
        } else {
            out += kReplacement;
        }
        i += consumed;
    }

    return out;
}

}  // namespace state
}  // namespace warden

#include "process_launcher.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace warden {
namespace process {

namespace {

bool has_path_separator(const std::string &path) {
#ifdef _WIN32
    return path.find_first_of("/\\") != std::string::npos;
#else
    return path.find('/') != std::string::npos;
#endif
}

bool names_match(const std::string &a, const std::string &b) {
#ifdef _WIN32
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
#else
    return a == b;
#endif
}

#ifndef _WIN32
// Child side of fork(): only async-signal-safe calls from here on.
[[noreturn]] void report_child_failure(int status_fd) {
    int err = errno;
    ssize_t written = write(status_fd, &err, sizeof(err));
    (void)written;  // Parent treats a short read as exec success; nothing else to do here
    _exit(127);
}
#endif

}  // namespace

std::vector<std::string> filtered_environment(const std::vector<std::string> &source,
                                              const std::vector<std::string> &unset) {
    std::vector<std::string> result;
    result.reserve(source.size());

    for (const auto &entry : source) {
        // Windows keeps per-drive cwd entries like "=C:=C:\dir"; skip the leading '='
        auto eq = entry.find('=', 1);
        std::string name = entry.substr(0, eq);

        bool removed = false;
        for (const auto &var : unset) {
            if (names_match(name, var)) {
                removed = true;
                break;
            }
        }
        if (removed) {
            LOG_DEBUG("[Launcher] Removing " << name << " from worker environment");
            continue;
        }
        result.push_back(entry);
    }

    return result;
}

std::vector<std::string> current_environment() {
    std::vector<std::string> env;
#ifdef _WIN32
    LPCH block = GetEnvironmentStringsA();
    if (!block) {
        return env;
    }
    for (const char *p = block; *p != '\0'; p += std::strlen(p) + 1) {
        env.emplace_back(p);
    }
    FreeEnvironmentStringsA(block);
#else
    for (char **p = environ; p && *p; ++p) {
        env.emplace_back(*p);
    }
#endif
    return env;
}

std::optional<ProcessId> DetachedProcessLauncher::launch(const LaunchRequest &request, std::string &error) {
    LOG_INFO("[Launcher] Spawning: " << request.executable);

    if (request.executable.empty()) {
        error = "Worker executable path is empty";
        LOG_ERROR("[Launcher] " << error);
        return std::nullopt;
    }

    if (request.output == kInvalidHandle) {
        error = "No output handle for worker";
        LOG_ERROR("[Launcher] " << error);
        return std::nullopt;
    }

    if (has_path_separator(request.executable)) {
        std::error_code ec;
        if (!std::filesystem::exists(request.executable, ec)) {
            error = "Executable not found: " + request.executable;
            LOG_ERROR("[Launcher] " << error);
            return std::nullopt;
        }
    }

#ifdef _WIN32
    return launch_windows(request, error);
#else
    return launch_posix(request, error);
#endif
}

#ifdef _WIN32
std::string build_command_line(const std::string &executable, const std::vector<std::string> &arguments) {
    auto quote = [](const std::string &arg) {
        if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
            return arg;
        }
        std::string quoted = "\"";
        for (auto it = arg.begin();; ++it) {
            size_t backslashes = 0;
            while (it != arg.end() && *it == '\\') {
                ++it;
                ++backslashes;
            }
            if (it == arg.end()) {
                quoted.append(backslashes * 2, '\\');
                break;
            }
            if (*it == '"') {
                quoted.append(backslashes * 2 + 1, '\\');
            } else {
                quoted.append(backslashes, '\\');
            }
            quoted.push_back(*it);
        }
        quoted.push_back('"');
        return quoted;
    };

    std::string cmdline = quote(executable);
    for (const auto &arg : arguments) {
        cmdline += " " + quote(arg);
    }
    return cmdline;
}

std::optional<ProcessId> DetachedProcessLauncher::launch_windows(const LaunchRequest &request, std::string &error) {
    HANDLE output = static_cast<HANDLE>(request.output);

    // Environment block: NAME=value\0NAME=value\0\0
    std::string env_block;
    for (const auto &entry : filtered_environment(current_environment(), request.unset_environment)) {
        env_block += entry;
        env_block.push_back('\0');
    }
    env_block.push_back('\0');
    env_block.push_back('\0');

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = NULL;

    HANDLE null_input = CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING,
                                    FILE_ATTRIBUTE_NORMAL, NULL);
    if (null_input == INVALID_HANDLE_VALUE) {
        error = "Failed to open NUL for worker stdin: " + std::to_string(GetLastError());
        return std::nullopt;
    }

    if (!SetHandleInformation(output, HANDLE_FLAG_INHERIT, HANDLE_FLAG_INHERIT)) {
        error = "Failed to make log handle inheritable: " + std::to_string(GetLastError());
        CloseHandle(null_input);
        return std::nullopt;
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = null_input;
    si.hStdOutput = output;
    si.hStdError = output;

    PROCESS_INFORMATION pi = {};

    std::string cmdline = build_command_line(request.executable, request.arguments);
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    // CREATE_NEW_PROCESS_GROUP keeps the launcher's Ctrl+C away from the worker.
    // DETACHED_PROCESS is deliberately not used: output already goes to the log.
    BOOL success = CreateProcessA(NULL, cmdline_buf.data(), NULL, NULL, TRUE, CREATE_NEW_PROCESS_GROUP,
                                  env_block.data(), NULL, &si, &pi);
    DWORD create_error = success ? 0 : GetLastError();

    SetHandleInformation(output, HANDLE_FLAG_INHERIT, 0);
    CloseHandle(null_input);

    if (!success) {
        error = "CreateProcess failed for " + request.executable + ": " + std::to_string(create_error);
        LOG_ERROR("[Launcher] " << error);
        return std::nullopt;
    }

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);

    LOG_INFO("[Launcher] Worker spawned (PID=" << pi.dwProcessId << ")");
    return static_cast<ProcessId>(pi.dwProcessId);
}
#else
std::optional<ProcessId> DetachedProcessLauncher::launch_posix(const LaunchRequest &request, std::string &error) {
    // Everything the child needs is built before fork()
    std::vector<std::string> env = filtered_environment(current_environment(), request.unset_environment);
    std::vector<char *> envp;
    envp.reserve(env.size() + 1);
    for (auto &entry : env) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char *> argv;
    argv.reserve(request.arguments.size() + 2);
    argv.push_back(const_cast<char *>(request.executable.c_str()));
    for (const auto &arg : request.arguments) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // The child writes errno here if exec fails; a successful exec closes it
    int status_pipe[2];
    if (pipe(status_pipe) < 0) {
        error = std::string("Failed to create status pipe: ") + std::strerror(errno);
        return std::nullopt;
    }
    fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (null_fd < 0) {
        error = std::string("Failed to open /dev/null: ") + std::strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return std::nullopt;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Fork failed: ") + std::strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        close(null_fd);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);

        // New session: no controlling terminal, own process group
        if (setsid() < 0) {
            report_child_failure(status_pipe[1]);
        }

        // Dispositions set to SIG_IGN survive exec; the worker starts clean
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        struct sigaction sa_dfl;
        std::memset(&sa_dfl, 0, sizeof(sa_dfl));
        sa_dfl.sa_handler = SIG_DFL;
        for (int sig = 1; sig < 32; ++sig) {
            sigaction(sig, &sa_dfl, nullptr);  // SIGKILL/SIGSTOP fail, harmlessly
        }

        if (dup2(null_fd, STDIN_FILENO) < 0 || dup2(request.output, STDOUT_FILENO) < 0 ||
            dup2(request.output, STDERR_FILENO) < 0) {
            report_child_failure(status_pipe[1]);
        }

        environ = envp.data();
        execvp(argv[0], argv.data());

        report_child_failure(status_pipe[1]);
    }

    // Parent process
    close(status_pipe[1]);
    close(null_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // Reap the failed child so it does not linger as a zombie
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        error = "Failed to execute " + request.executable + ": " + std::strerror(child_errno);
        LOG_ERROR("[Launcher] " << error);
        return std::nullopt;
    }

    LOG_INFO("[Launcher] Worker spawned (PID=" << pid << ")");
    return static_cast<ProcessId>(pid);
}
#endif

}  // namespace process
}  // namespace warden

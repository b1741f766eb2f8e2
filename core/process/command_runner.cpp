#include "command_runner.hpp"

#include <cstring>

#include "logging/logger.hpp"
#include "process_launcher.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace warden {
namespace process {

int run_foreground(const std::vector<std::string> &argv, std::string &error,
                   const std::vector<std::string> &unset_environment) {
    if (argv.empty() || argv[0].empty()) {
        error = "Empty command";
        return kCommandNotStarted;
    }

    std::string joined;
    for (const auto &arg : argv) {
        joined += (joined.empty() ? "" : " ") + arg;
    }
    LOG_INFO("[Command] Running: " << joined);

    std::vector<std::string> env = filtered_environment(current_environment(), unset_environment);

#ifdef _WIN32
    std::string env_block;
    for (const auto &entry : env) {
        env_block += entry;
        env_block.push_back('\0');
    }
    env_block.push_back('\0');
    env_block.push_back('\0');

    std::vector<std::string> rest(argv.begin() + 1, argv.end());
    std::string cmdline = build_command_line(argv[0], rest);
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(NULL, cmdline_buf.data(), NULL, NULL, FALSE, 0, env_block.data(), NULL, &si, &pi)) {
        error = "CreateProcess failed for " + argv[0] + ": " + std::to_string(GetLastError());
        LOG_ERROR("[Command] " << error);
        return kCommandNotStarted;
    }
    CloseHandle(pi.hThread);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exit_code = 1;
    if (!GetExitCodeProcess(pi.hProcess, &exit_code)) {
        error = "GetExitCodeProcess failed: " + std::to_string(GetLastError());
        exit_code = 1;
    }
    CloseHandle(pi.hProcess);
    LOG_DEBUG("[Command] " << argv[0] << " exited with " << exit_code);
    return static_cast<int>(exit_code);
#else
    std::vector<char *> envp;
    envp.reserve(env.size() + 1);
    for (auto &entry : env) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int status_pipe[2];
    if (pipe(status_pipe) < 0) {
        error = std::string("Failed to create status pipe: ") + std::strerror(errno);
        return kCommandNotStarted;
    }
    fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("Fork failed: ") + std::strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return kCommandNotStarted;
    }

    if (pid == 0) {
        close(status_pipe[0]);
        environ = envp.data();
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t written = write(status_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(kCommandNotStarted);
    }

    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        error = "Failed to execute " + argv[0] + ": " + std::strerror(child_errno);
        LOG_ERROR("[Command] " << error);
        return kCommandNotStarted;
    }

    if (waited < 0) {
        error = std::string("waitpid failed: ") + std::strerror(errno);
        LOG_ERROR("[Command] " << error);
        return 1;
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        LOG_DEBUG("[Command] " << argv[0] << " exited with " << code);
        return code;
    }
    if (WIFSIGNALED(status)) {
        LOG_WARN("[Command] " << argv[0] << " killed by signal " << WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    return 1;
#endif
}

}  // namespace process
}  // namespace warden

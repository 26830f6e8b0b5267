#include "command_runner.hpp"
#include "fleet_log.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fleet {

namespace {

// Bound on captured text per stream; the rest is drained and dropped
constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;

void appendCapped(std::string& dst, const char* data, size_t len) {
    if (dst.size() >= MAX_CAPTURE_BYTES) return;
    size_t room = MAX_CAPTURE_BYTES - dst.size();
    dst.append(data, std::min(len, room));
}

std::string getExeDir() {
#ifdef _WIN32
    char path[MAX_PATH];
    DWORD len = GetModuleFileNameA(nullptr, path, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) return ".";
    std::string exe_path(path, len);
#else
    char path[4096];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len <= 0) return ".";
    std::string exe_path(path, static_cast<size_t>(len));
#endif
    size_t pos = exe_path.find_last_of("\\/");
    return (pos != std::string::npos) ? exe_path.substr(0, pos) : ".";
}

bool isUsableFile(const std::string& path) {
    std::error_code ec;
    return !path.empty() && std::filesystem::is_regular_file(path, ec) && !ec;
}

#ifndef _WIN32
// Both ends close-on-exec: children forked by concurrent launches must not
// inherit each other's pipes. dup2() onto stdout/stderr clears the flag.
int makePipe(int fds[2]) {
#ifdef __linux__
    return pipe2(fds, O_CLOEXEC);
#else
    if (pipe(fds) != 0) return -1;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}
#endif

} // anonymous namespace

std::string trimCopy(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// =============================================================================
// Process launching
// =============================================================================

#ifdef _WIN32

ProcessOutput launchProcess(const std::string& command_line, int timeout_sec) {
    ProcessOutput result;

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE out_read = nullptr, out_write = nullptr;
    HANDLE err_read = nullptr, err_write = nullptr;
    if (!CreatePipe(&out_read, &out_write, &sa, 0)) {
        result.launch_error = "CreatePipe failed";
        return result;
    }
    if (!CreatePipe(&err_read, &err_write, &sa, 0)) {
        CloseHandle(out_read);
        CloseHandle(out_write);
        result.launch_error = "CreatePipe failed";
        return result;
    }
    // Read ends stay in this process
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.hStdOutput = out_write;
    si.hStdError = err_write;
    si.hStdInput = nullptr;
    si.wShowWindow = SW_HIDE;

    PROCESS_INFORMATION pi = {};
    std::string cmd_copy = "cmd /c " + command_line;

    if (!CreateProcessA(nullptr, cmd_copy.data(), nullptr, nullptr, TRUE,
                        CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        result.launch_error = "CreateProcess failed: " + std::to_string(GetLastError());
        CloseHandle(out_read); CloseHandle(out_write);
        CloseHandle(err_read); CloseHandle(err_write);
        return result;
    }
    result.launched = true;
    CloseHandle(out_write);
    CloseHandle(err_write);

    const DWORD timeout_ms = static_cast<DWORD>(timeout_sec) * 1000;
    DWORD start_tick = GetTickCount();
    char buffer[4096];

    auto drain = [&](HANDLE h, std::string& dst) -> bool {
        DWORD available = 0;
        if (!PeekNamedPipe(h, nullptr, 0, nullptr, &available, nullptr) || available == 0) return false;
        DWORD bytes_read = 0;
        DWORD to_read = (available < sizeof(buffer)) ? available : sizeof(buffer);
        if (ReadFile(h, buffer, to_read, &bytes_read, nullptr) && bytes_read > 0) {
            appendCapped(dst, buffer, bytes_read);
            return true;
        }
        return false;
    };

    while (true) {
        bool got = drain(out_read, result.stdout_text);
        got = drain(err_read, result.stderr_text) || got;
        if (got) continue;

        DWORD status = STILL_ACTIVE;
        GetExitCodeProcess(pi.hProcess, &status);
        if (status != STILL_ACTIVE) {
            while (drain(out_read, result.stdout_text)) {}
            while (drain(err_read, result.stderr_text)) {}
            result.exit_code = static_cast<int>(status);
            break;
        }
        if (GetTickCount() - start_tick > timeout_ms) {
            TerminateProcess(pi.hProcess, 1);
            result.timed_out = true;
            break;
        }
        Sleep(25);
    }

    WaitForSingleObject(pi.hProcess, 1000);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    CloseHandle(out_read);
    CloseHandle(err_read);
    return result;
}

#else

ProcessOutput launchProcess(const std::string& command_line, int timeout_sec) {
    ProcessOutput result;

    int out_pipe[2];
    int err_pipe[2];
    if (makePipe(out_pipe) != 0) {
        result.launch_error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (makePipe(err_pipe) != 0) {
        result.launch_error = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.launch_error = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Own process group so a timeout can take down the whole pipeline
        setpgid(0, 0);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        execl("/bin/sh", "sh", "-c", command_line.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    result.launched = true;
    close(out_pipe[1]);
    close(err_pipe[1]);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    struct pollfd fds[2];
    bool open_fd[2] = {true, true};
    int read_fd[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
    char buffer[4096];
    bool exited = false;
    int status = 0;

    // Reads whatever is ready within wait_ms; returns false once both pipes hit EOF
    auto pump = [&](int wait_ms) -> bool {
        for (int i = 0; i < 2; ++i) {
            fds[i].fd = open_fd[i] ? read_fd[i] : -1;
            fds[i].events = POLLIN;
            fds[i].revents = 0;
        }
        int rc = poll(fds, 2, wait_ms);
        if (rc < 0) return errno == EINTR;
        if (rc == 0) return open_fd[0] || open_fd[1];
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(read_fd[i], buffer, sizeof(buffer));
            if (n > 0) {
                appendCapped(*sinks[i], buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                open_fd[i] = false;
            }
        }
        return open_fd[0] || open_fd[1];
    };

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        bool pipes_open = pump(static_cast<int>(std::min<long long>(remaining, 50)));

        if (!exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
        }
        if (exited) {
            // Daemons spawned by the tool may keep the pipes open: take what is
            // already buffered and stop.
            int guard = 0;
            while (pipes_open && guard++ < 256) {
                struct pollfd probe[2];
                int nfds = 0;
                for (int i = 0; i < 2; ++i) {
                    if (open_fd[i]) { probe[nfds].fd = read_fd[i]; probe[nfds].events = POLLIN; probe[nfds].revents = 0; ++nfds; }
                }
                if (nfds == 0 || poll(probe, nfds, 0) <= 0) break;
                pipes_open = pump(0);
            }
            break;
        }
    }

    close(out_pipe[0]);
    close(err_pipe[0]);

    if (result.timed_out && !exited) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

#endif

// =============================================================================
// CommandRunner
// =============================================================================

CommandRunner::CommandRunner(std::string bridge_path, ProcessLauncher launcher, int control_timeout_sec)
    : bridge_path_(std::move(bridge_path)), launcher_(std::move(launcher)),
      control_timeout_sec_(control_timeout_sec > 0 ? control_timeout_sec : kControlTimeoutSec) {
    if (bridge_path_.empty()) {
        FLOG_WARN("runner", "Bridge executable not available; bridge commands will fail");
    } else {
        FLOG_DEBUG("runner", "Bridge executable: %s", bridge_path_.c_str());
    }
}

std::string CommandRunner::locateBridge(const std::string& override_path) {
    if (!override_path.empty()) {
        if (isUsableFile(override_path)) return override_path;
        FLOG_WARN("runner", "Configured bridge path does not exist: %s", override_path.c_str());
        return "";
    }

#ifdef _WIN32
    std::string local = getExeDir() + "\\adb\\adb.exe";
#else
    std::string local = getExeDir() + "/adb/adb";
#endif
    if (isUsableFile(local)) return local;

    FLOG_WARN("runner", "Bridge executable not found at %s", local.c_str());
    return "";
}

CommandResult CommandRunner::run(const std::string& args, int timeout_sec) const {
    if (bridge_path_.empty()) {
        FLOG_ERROR("runner", "Cannot run '%s': %s", args.c_str(), kToolNotFoundError);
        return CommandResult::failure(kToolNotFoundError, ErrorKind::ToolUnavailable);
    }

    std::string prefix = bridge_path_;
    if (prefix.find(' ') != std::string::npos) {
        prefix = "\"" + prefix + "\"";
    }
    return execute(prefix + " " + args, timeout_sec);
}

CommandResult CommandRunner::runSystem(const std::string& command_line, int timeout_sec) const {
    return execute(command_line, timeout_sec);
}

CommandResult CommandRunner::execute(const std::string& command_line, int timeout_sec) const {
    FLOG_DEBUG("runner", "Executing (timeout %ds): %s", timeout_sec, command_line.c_str());

    ProcessOutput proc = launcher_(command_line, timeout_sec);

    if (!proc.launched) {
        FLOG_ERROR("runner", "Failed to launch '%s': %s", command_line.c_str(), proc.launch_error.c_str());
        return CommandResult::failure("failed to launch command: " + proc.launch_error,
                                      ErrorKind::ExecutionFailure);
    }

    if (proc.timed_out) {
        FLOG_ERROR("runner", "Command timed out after %ds: %s", timeout_sec, command_line.c_str());
        return CommandResult::failure(kTimedOutError, ErrorKind::ExecutionTimeout);
    }

    if (proc.exit_code == 0) {
        return CommandResult::ok(trimCopy(proc.stdout_text));
    }

    std::string err = trimCopy(proc.stderr_text);
    FLOG_ERROR("runner", "Command failed (exit %d): %s: %s", proc.exit_code, command_line.c_str(), err.c_str());
    return CommandResult::failure(err, ErrorKind::ExecutionFailure, trimCopy(proc.stdout_text));
}

} // namespace fleet

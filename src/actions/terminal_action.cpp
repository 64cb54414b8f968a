#include "terminal_action.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <thread>
#else
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace skillgate {

static void append_limited(std::string& dst, const char* src, size_t n,
                           size_t limit, bool& truncated) {
    size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    size_t take = std::min(n, avail);
    dst.append(src, take);
    if (take < n) truncated = true;
}

#ifdef _WIN32

static void drain_handle(HANDLE h, std::string& out, size_t limit, bool& truncated) {
    char buf[4096];
    DWORD n = 0;
    while (ReadFile(h, buf, sizeof(buf), &n, nullptr) && n > 0) {
        append_limited(out, buf, n, limit, truncated);
    }
}

CommandOutput run_command(const CommandSpec& spec) {
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE out_read, out_write, err_read, err_write;
    if (!CreatePipe(&out_read, &out_write, &sa, 0)) {
        throw SkillError(ErrorKind::spawn_failed, "Failed to create stdout pipe");
    }
    if (!CreatePipe(&err_read, &err_write, &sa, 0)) {
        CloseHandle(out_read);
        CloseHandle(out_write);
        throw SkillError(ErrorKind::spawn_failed, "Failed to create stderr pipe");
    }
    SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = out_write;
    si.hStdError = err_write;

    PROCESS_INFORMATION pi = {};
    std::string cmdline = "cmd.exe /C " + spec.command;

    BOOL ok = CreateProcessA(
        nullptr, const_cast<char*>(cmdline.c_str()),
        nullptr, nullptr, TRUE, 0, nullptr,
        spec.working_dir.empty() ? nullptr : spec.working_dir.c_str(),
        &si, &pi
    );

    CloseHandle(out_write);
    CloseHandle(err_write);

    if (!ok) {
        CloseHandle(out_read);
        CloseHandle(err_read);
        throw SkillError(ErrorKind::spawn_failed, "Failed to create process: " + spec.command);
    }
    CloseHandle(pi.hThread);

    CommandOutput result;
    bool out_trunc = false, err_trunc = false;
    std::thread out_reader(drain_handle, out_read, std::ref(result.stdout_text),
                           spec.max_output_bytes, std::ref(out_trunc));
    std::thread err_reader(drain_handle, err_read, std::ref(result.stderr_text),
                           spec.max_output_bytes, std::ref(err_trunc));

    bool timed_out = WaitForSingleObject(pi.hProcess,
        static_cast<DWORD>(std::min<int64_t>(spec.timeout_ms, INFINITE - 1))) == WAIT_TIMEOUT;
    if (timed_out) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, 3000);
    }
    out_reader.join();
    err_reader.join();

    DWORD code = 0;
    GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hProcess);
    CloseHandle(out_read);
    CloseHandle(err_read);

    if (timed_out) {
        throw SkillError(ErrorKind::command_timed_out,
                         "Command timed out after " + std::to_string(spec.timeout_ms) + " ms");
    }
    result.exit_code = static_cast<int>(code);
    result.truncated = out_trunc || err_trunc;
    return result;
}

#else

CommandOutput run_command(const CommandSpec& spec) {
    int out_pipe[2], err_pipe[2];
    if (pipe(out_pipe) != 0) {
        throw SkillError(ErrorKind::spawn_failed, std::string("pipe: ") + std::strerror(errno));
    }
    if (pipe(err_pipe) != 0) {
        int err = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        throw SkillError(ErrorKind::spawn_failed, std::string("pipe: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        throw SkillError(ErrorKind::spawn_failed, std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // own process group so a timeout kills the whole pipeline
        setpgid(0, 0);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
            _exit(127);
        }
        execl("/bin/sh", "sh", "-c", spec.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    CommandOutput result;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(spec.timeout_ms);
    struct pollfd fds[2];
    fds[0].fd = out_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0];
    fds[1].events = POLLIN;
    std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};

    char buf[4096];
    int status = 0;
    bool exited = false;
    bool timed_out = false;

    auto drain = [&](int i) {
        while (true) {
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                append_limited(*sinks[i], buf, static_cast<size_t>(n),
                               spec.max_output_bytes, result.truncated);
                continue;
            }
            if (n == 0) fds[i].fd = -1;   // EOF, poll ignores negative fds
            break;
        }
    };

    while (!exited) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            timed_out = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<int64_t>(remaining, 50));

        if (fds[0].fd >= 0 || fds[1].fd >= 0) {
            int ret = poll(fds, 2, wait_ms);
            if (ret < 0 && errno != EINTR) {
                std::cerr << "[exec] poll failed: " << std::strerror(errno) << "\n";
            }
            for (int i = 0; i < 2; i++) {
                if (fds[i].fd >= 0 && (fds[i].revents & (POLLIN | POLLHUP | POLLERR))) drain(i);
            }
        } else {
            poll(nullptr, 0, wait_ms);
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) exited = true;
    }

    // pick up anything written just before exit
    for (int i = 0; i < 2; i++) {
        if (fds[i].fd >= 0) drain(i);
    }
    close(out_pipe[0]);
    close(err_pipe[0]);

    if (timed_out) {
        throw SkillError(ErrorKind::command_timed_out,
                         "Command timed out after " + std::to_string(spec.timeout_ms) + " ms");
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

#endif

void register_terminal_action(LocalActionExecutor& exec, const Config& cfg) {
    int default_timeout = cfg.command_timeout;
    int max_timeout = cfg.max_command_timeout;
    size_t max_output = static_cast<size_t>(cfg.max_output_bytes);
    std::string workspace = cfg.workspace_path();

    exec.register_action("run_terminal_command",
        [=](const nlohmann::json& args) -> nlohmann::json {
            CommandSpec spec;
            spec.command = args.value("command", "");
            spec.max_output_bytes = max_output;

            double seconds = default_timeout;
            if (args.contains("timeoutSeconds") && args["timeoutSeconds"].is_number()) {
                seconds = args["timeoutSeconds"].get<double>();
            }
            if (!(seconds > 0)) seconds = default_timeout;
            seconds = std::min(seconds, static_cast<double>(max_timeout));
            spec.timeout_ms = static_cast<int64_t>(std::llround(seconds * 1000.0));

            if (args.contains("workingDir") && args["workingDir"].is_string()) {
                fs::path dir(args["workingDir"].get<std::string>());
                if (dir.is_relative()) dir = fs::path(workspace) / dir;
                std::error_code ec;
                if (!fs::is_directory(dir, ec)) {
                    throw SkillError(ErrorKind::spawn_failed,
                                     "Working directory does not exist: " + dir.string(), "workingDir");
                }
                spec.working_dir = dir.string();
            }

            CommandOutput out = run_command(spec);
            if (out.exit_code != 0) {
                std::cerr << "[exec] exit code " << out.exit_code << ": " << spec.command << "\n";
            }
            return {
                {"output", out.stdout_text},
                {"stdout", out.stdout_text},
                {"stderr", out.stderr_text},
                {"exitCode", out.exit_code},
                {"truncated", out.truncated}
            };
        });
}

} // namespace skillgate

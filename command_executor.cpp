/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <screenwatch.h>

using namespace ScreenWatch;

namespace {
//!
//! \brief Appends data to the capture buffer up to the capture limit. Data beyond the limit is drained and dropped.
//!
void AppendCapture(std::string& capture, const char* data, size_t size)
{
    if (capture.size() < CommandExecutor::MAX_CAPTURE_BYTES) {
        capture.append(data, std::min(size, CommandExecutor::MAX_CAPTURE_BYTES - capture.size()));
    }
}

std::optional<std::string> ToSnippet(const std::string& capture)
{
    std::string snippet = TrimString(capture);

    if (snippet.empty()) {
        return std::nullopt;
    }

    return snippet;
}

void ClosePipe(int pipe_fd[2])
{
    for (int i = 0; i < 2; ++i) {
        if (pipe_fd[i] != -1) {
            close(pipe_fd[i]);
            pipe_fd[i] = -1;
        }
    }
}
} // anonymous namespace

// Class ExecutionResult

ExecutionResult::ExecutionResult()
    : m_status(LAUNCH_FAILED)
    , m_exit_code(-1)
    , m_duration_ms(0)
    , m_stdout_snippet()
    , m_stderr_snippet()
    , m_error_message()
{}

std::string ExecutionResult::StatusToString(const Status& status)
{
    std::string out;

    switch (status) {
    case EXITED:
        out = "EXITED";
        break;
    case SIGNALED:
        out = "SIGNALED";
        break;
    case LAUNCH_FAILED:
        out = "LAUNCH_FAILED";
        break;
    }

    return out;
}

bool ExecutionResult::IsSuccess() const
{
    return m_status == EXITED && m_exit_code == 0;
}

// Class CommandExecutor

CommandExecutor::CommandExecutor()
{}

ExecutionResult CommandExecutor::Run(const std::string& command)
{
    ExecutionResult result;

    auto start_time = std::chrono::steady_clock::now();

    auto elapsed_ms = [&start_time]() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - start_time).count());
    };

    if (TrimString(command).empty()) {
        result.m_error_message = "empty command";
        return result;
    }

    int stdout_pipe_fd[2] = {-1, -1};
    int stderr_pipe_fd[2] = {-1, -1};

    if (pipe2(stdout_pipe_fd, O_CLOEXEC) == -1 || pipe2(stderr_pipe_fd, O_CLOEXEC) == -1) {
        result.m_error_message = std::string("failed to create output pipes: ") + strerror(errno);
        ClosePipe(stdout_pipe_fd);
        ClosePipe(stderr_pipe_fd);
        return result;
    }

    // Everything the child needs is prepared before fork(), since only async-signal-safe calls are allowed in the
    // child of a multithreaded process.
    const char* shell_command = command.c_str();

    sigset_t empty_mask;
    sigemptyset(&empty_mask);

    pid_t pid = fork();

    if (pid == -1) {
        result.m_error_message = std::string("fork failed: ") + strerror(errno);
        ClosePipe(stdout_pipe_fd);
        ClosePipe(stderr_pipe_fd);
        return result;
    }

    if (pid == 0) {
        // The daemon blocks termination signals for sigwait(). The command must not inherit that mask.
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        if (dup2(stdout_pipe_fd[1], STDOUT_FILENO) == -1 || dup2(stderr_pipe_fd[1], STDERR_FILENO) == -1) {
            _exit(127);
        }

        execl("/bin/sh", "sh", "-c", shell_command, static_cast<char*>(nullptr));

        _exit(127);
    }

    close(stdout_pipe_fd[1]);
    stdout_pipe_fd[1] = -1;
    close(stderr_pipe_fd[1]);
    stderr_pipe_fd[1] = -1;

    std::string stdout_capture;
    std::string stderr_capture;

    struct pollfd fds[2];
    fds[0].fd = stdout_pipe_fd[0];
    fds[0].events = POLLIN;
    fds[1].fd = stderr_pipe_fd[0];
    fds[1].events = POLLIN;

    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int poll_ret = poll(fds, 2, -1);

        if (poll_ret < 0) {
            if (errno == EINTR) {
                continue;
            }

            error_log("%s: poll() on command output failed: %s",
                      __func__,
                      strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }

            ssize_t bytes_read = read(fds[i].fd, buf, sizeof(buf));

            if (bytes_read > 0) {
                AppendCapture(i == 0 ? stdout_capture : stderr_capture, buf, static_cast<size_t>(bytes_read));
            } else if (bytes_read == 0 || errno != EINTR) {
                // EOF or error. Negative fds are ignored by poll().
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    ClosePipe(stdout_pipe_fd);
    ClosePipe(stderr_pipe_fd);

    int status = 0;
    pid_t wait_ret;

    do {
        wait_ret = waitpid(pid, &status, 0);
    } while (wait_ret == -1 && errno == EINTR);

    result.m_duration_ms = elapsed_ms();
    result.m_stdout_snippet = ToSnippet(stdout_capture);
    result.m_stderr_snippet = ToSnippet(stderr_capture);

    if (wait_ret == -1) {
        result.m_status = ExecutionResult::LAUNCH_FAILED;
        result.m_error_message = std::string("waitpid failed: ") + strerror(errno);
        return result;
    }

    if (WIFSIGNALED(status)) {
        result.m_status = ExecutionResult::SIGNALED;
        result.m_exit_code = 128 + WTERMSIG(status);
        return result;
    }

    result.m_exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    // The shell reports 127 for a command it cannot find and 126 for one it cannot execute.
    if (result.m_exit_code == 127) {
        result.m_status = ExecutionResult::LAUNCH_FAILED;
        result.m_error_message = "command not found";
    } else if (result.m_exit_code == 126) {
        result.m_status = ExecutionResult::LAUNCH_FAILED;
        result.m_error_message = "permission denied or not executable";
    } else {
        result.m_status = ExecutionResult::EXITED;
    }

    if (result.m_status == ExecutionResult::LAUNCH_FAILED && result.m_stderr_snippet) {
        result.m_error_message += ": " + *result.m_stderr_snippet;
    }

    return result;
}

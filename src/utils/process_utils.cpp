/**
 * @file process_utils.cpp
 * @brief fork/exec process runner with separate stdout/stderr capture
 *
 * **Lifecycle**:
 * ```
 * pipe2 x4 -> fork -> child: setpgid, dup2, execvp
 *                  -> parent: exec-error handshake -> poll loop -> reap
 * ```
 *
 * The exec-error pipe is close-on-exec: a successful execvp closes it and the
 * parent reads EOF, a failed one writes errno before _exit(127).
 *
 * **Termination**:
 * - Deadline or cancel flag: SIGKILL to the process group, then the pid
 * - Remaining buffered output is drained after the child is reaped
 *
 * @date 2025
 */

#include "faasbox/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace faasbox {
namespace utils {

namespace {

constexpr int kPollSliceMs = 20;
constexpr std::size_t kReadChunk = 4096;

// Writing into the stdin pipe of a child that already exited raises SIGPIPE
void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

struct Pipe {
    int read_end{-1};
    int write_end{-1};

    bool Open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    void Close() {
        CloseFd(read_end);
        CloseFd(write_end);
    }
};

/**
 * @brief Read whatever is available from fd into the capture buffer
 * @return false once the stream reached EOF or failed
 */
bool DrainStream(int fd, std::string& capture, std::size_t cap, bool& truncated,
                 const std::function<void(const std::string&)>& callback) {
    char buffer[kReadChunk];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::string chunk(buffer, static_cast<std::size_t>(n));
            std::size_t room = cap > capture.size() ? cap - capture.size() : 0;
            if (chunk.size() > room) {
                truncated = true;
                capture.append(chunk, 0, room);
            } else {
                capture += chunk;
            }
            if (callback) {
                callback(chunk);
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void KillGroup(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

void DecodeStatus(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    } else {
        result.exit_code = 128;
    }
}

} // anonymous namespace

ProcessResult ProcessRunner::Run(const ProcessOptions& options) {
    ProcessResult result;
    auto start_time = std::chrono::steady_clock::now();

    if (options.argv.empty() || options.argv[0].empty()) {
        result.error_message = "empty argv";
        return result;
    }

    IgnoreSigpipeOnce();

    Pipe in_pipe, out_pipe, err_pipe, exec_pipe;
    if (!in_pipe.Open() || !out_pipe.Open() || !err_pipe.Open() || !exec_pipe.Open()) {
        result.error_message = std::string("pipe2 failed: ") + std::strerror(errno);
        in_pipe.Close();
        out_pipe.Close();
        err_pipe.Close();
        exec_pipe.Close();
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.error_message = std::string("fork failed: ") + std::strerror(errno);
        in_pipe.Close();
        out_pipe.Close();
        err_pipe.Close();
        exec_pipe.Close();
        return result;
    }

    if (pid == 0) {
        // child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
#ifdef __linux__
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe.read_end, STDIN_FILENO);
        ::dup2(out_pipe.write_end, STDOUT_FILENO);
        ::dup2(err_pipe.write_end, STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe.write_end, &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    // parent
    ::setpgid(pid, pid);
    CloseFd(in_pipe.read_end);
    CloseFd(out_pipe.write_end);
    CloseFd(err_pipe.write_end);
    CloseFd(exec_pipe.write_end);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe.read_end, &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    CloseFd(exec_pipe.read_end);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        CloseFd(in_pipe.write_end);
        CloseFd(out_pipe.read_end);
        CloseFd(err_pipe.read_end);
        result.error_message = "exec " + options.argv[0] + " failed: " + std::strerror(exec_errno);
        return result;
    }

    result.started = true;

    SetNonBlocking(in_pipe.write_end);
    SetNonBlocking(out_pipe.read_end);
    SetNonBlocking(err_pipe.read_end);

    std::size_t stdin_offset = 0;
    if (options.stdin_data.empty()) {
        CloseFd(in_pipe.write_end);
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = start_time + *options.timeout;
    }

    int status = 0;
    bool reaped = false;

    while (!reaped) {
        // Termination requests
        bool cancel = options.cancel_flag && options.cancel_flag->load();
        bool expired = deadline && std::chrono::steady_clock::now() >= *deadline;
        if (cancel || expired) {
            result.cancelled = cancel;
            result.timed_out = !cancel && expired;
            KillGroup(pid);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            reaped = true;
            break;
        }

        std::vector<pollfd> fds;
        if (out_pipe.read_end >= 0) fds.push_back({out_pipe.read_end, POLLIN, 0});
        if (err_pipe.read_end >= 0) fds.push_back({err_pipe.read_end, POLLIN, 0});
        if (in_pipe.write_end >= 0) fds.push_back({in_pipe.write_end, POLLOUT, 0});

        if (fds.empty()) {
            // All streams closed: wait for the exit status without blocking past the deadline
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollSliceMs / 4));
            continue;
        }

        int ready = ::poll(fds.data(), fds.size(), kPollSliceMs);
        if (ready < 0 && errno != EINTR) {
            result.error_message = std::string("poll failed: ") + std::strerror(errno);
            KillGroup(pid);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            reaped = true;
            break;
        }

        for (const auto& pfd : fds) {
            if (pfd.revents == 0) continue;

            if (pfd.fd == out_pipe.read_end) {
                if (!DrainStream(out_pipe.read_end, result.stdout_output, options.max_output_bytes,
                                 result.output_truncated, options.on_stdout)) {
                    CloseFd(out_pipe.read_end);
                }
            } else if (pfd.fd == err_pipe.read_end) {
                if (!DrainStream(err_pipe.read_end, result.stderr_output, options.max_output_bytes,
                                 result.output_truncated, options.on_stderr)) {
                    CloseFd(err_pipe.read_end);
                }
            } else if (pfd.fd == in_pipe.write_end) {
                if (pfd.revents & (POLLERR | POLLHUP)) {
                    CloseFd(in_pipe.write_end);
                    continue;
                }
                const char* data = options.stdin_data.data() + stdin_offset;
                std::size_t remaining = options.stdin_data.size() - stdin_offset;
                ssize_t written = ::write(in_pipe.write_end, data, remaining);
                if (written > 0) {
                    stdin_offset += static_cast<std::size_t>(written);
                    if (stdin_offset >= options.stdin_data.size()) {
                        CloseFd(in_pipe.write_end);
                    }
                } else if (written < 0 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: the child stopped reading
                    CloseFd(in_pipe.write_end);
                }
            }
        }

        // A grandchild may hold the pipes open after the child itself exited
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            reaped = true;
        }
    }

    // Drain what the child left in the pipes
    if (out_pipe.read_end >= 0) {
        DrainStream(out_pipe.read_end, result.stdout_output, options.max_output_bytes,
                    result.output_truncated, options.on_stdout);
    }
    if (err_pipe.read_end >= 0) {
        DrainStream(err_pipe.read_end, result.stderr_output, options.max_output_bytes,
                    result.output_truncated, options.on_stderr);
    }
    CloseFd(in_pipe.write_end);
    CloseFd(out_pipe.read_end);
    CloseFd(err_pipe.read_end);

    DecodeStatus(status, result);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (result.timed_out || result.cancelled) {
        spdlog::debug("Process {} (pid {}) killed after {} ms ({})",
                      options.argv[0], pid, result.duration.count(),
                      result.timed_out ? "deadline" : "cancelled");
    }

    return result;
}

} // namespace utils
} // namespace faasbox

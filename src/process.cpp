#include "../include/patchwise/process.hpp"
#include "../include/patchwise/log.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace patchwise {

namespace {

using Clock = std::chrono::steady_clock;

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    return args;
}

void redirect_stdin_to_null() {
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        close(null_fd);
    }
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(std::vector<char*>& args) {
    execvp(args[0], args.data());
    const char* prefix = "exec failed: ";
    const char* reason = std::strerror(errno);
    ssize_t ignored = write(STDERR_FILENO, prefix, std::strlen(prefix));
    ignored = write(STDERR_FILENO, reason, std::strlen(reason));
    ignored = write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    _exit(127);
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int wait_blocking(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_status(status);
}

void drain_nonblocking(int fd, std::string& output) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            output.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
}

} // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        throw std::runtime_error("empty command line");
    }
    int out_pipe[2];
    if (pipe(out_pipe) < 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    fcntl(out_pipe[0], F_SETFD, FD_CLOEXEC);

    auto args = make_argv(argv);
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        setpgid(0, 0);
        redirect_stdin_to_null();
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        exec_child(args);
    }

    // Set the group from both sides so killpg cannot race the child's own setpgid.
    setpgid(pid, pid);
    close(out_pipe[1]);

    ProcessResult result;
    const auto deadline = Clock::now() + timeout;
    std::array<char, 4096> buffer{};
    const int fd = out_pipe[0];

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        pollfd pfd{fd, POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }
        const ssize_t n = read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break; // EOF: every writer in the group closed the pipe
    }

    if (!result.timed_out) {
        // Output closed but the leader may still be running; keep honouring the deadline.
        while (true) {
            int status = 0;
            const pid_t done = waitpid(pid, &status, WNOHANG);
            if (done == pid) {
                result.exit_code = decode_status(status);
                close(fd);
                return result;
            }
            if (done < 0 && errno != EINTR) {
                result.exit_code = -1;
                close(fd);
                return result;
            }
            if (Clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    log_debug("process", "timeout reached; killing process group " + std::to_string(pid));
    killpg(pid, SIGKILL);
    drain_nonblocking(fd, result.output);
    close(fd);
    result.exit_code = wait_blocking(pid);
    return result;
}

long PosixProcessRunner::start_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw std::runtime_error("empty command line");
    }
    int report[2];
    if (pipe(report) < 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }

    auto args = make_argv(argv);
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        close(report[0]);
        close(report[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(err));
    }
    if (pid == 0) {
        // Intermediate child: the grandchild is reparented to init and never becomes our zombie.
        close(report[0]);
        setsid();
        const pid_t grandchild = fork();
        if (grandchild > 0) {
            const long value = grandchild;
            ssize_t ignored = write(report[1], &value, sizeof(value));
            (void)ignored;
            _exit(0);
        }
        if (grandchild < 0) {
            _exit(1);
        }
        close(report[1]);
        const int null_fd = open("/dev/null", O_RDWR);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            dup2(null_fd, STDOUT_FILENO);
            dup2(null_fd, STDERR_FILENO);
            close(null_fd);
        }
        exec_child(args);
    }

    close(report[1]);
    long detached = -1;
    ssize_t got = 0;
    do {
        got = read(report[0], &detached, sizeof(detached));
    } while (got < 0 && errno == EINTR);
    close(report[0]);
    const int intermediate = wait_blocking(pid);
    if (got != static_cast<ssize_t>(sizeof(detached)) || intermediate != 0) {
        throw std::runtime_error("failed to start background process");
    }
    return detached;
}

} // namespace patchwise

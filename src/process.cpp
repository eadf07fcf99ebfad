#include "mediavault/process.hpp"
#include "mediavault/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace mediavault {

namespace {

constexpr size_t kMaxStderr = 16 * 1024;

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}  // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      std::chrono::seconds timeout) {
    ProcessResult result;
    if (argv.empty()) return result;

    // exec_pipe reports an exec failure (errno) from the child; it is
    // close-on-exec, so a successful exec reads as EOF.
    int exec_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        log_error("pipe2 failed: %s", strerror(errno));
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        log_error("pipe2 failed: %s", strerror(errno));
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        log_error("fork failed: %s", strerror(errno));
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        dup2(err_pipe[1], STDERR_FILENO);
        execvp(args[0], args.data());
        int err = errno;
        ssize_t written = write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent
    close_fd(exec_pipe[1]);
    close_fd(err_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(err_pipe[0]);
        int status = 0;
        waitpid(pid, &status, 0);
        log_warn("Cannot execute %s: %s", argv[0].c_str(), strerror(exec_errno));
        return result;
    }
    result.launched = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    bool eof = false;
    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }
        struct pollfd pfd{err_pipe[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining.count(), 1000)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            log_error("poll failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) continue;
        ssize_t got = read(err_pipe[0], buf, sizeof(buf));
        if (got < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (got == 0) {
            eof = true;
            break;
        }
        result.stderr_output.append(buf, static_cast<size_t>(got));
        if (result.stderr_output.size() > kMaxStderr) {
            result.stderr_output.erase(0, result.stderr_output.size() - kMaxStderr);
        }
    }
    close_fd(err_pipe[0]);

    // A child may close stderr and keep running, so the deadline still
    // applies after EOF.
    int status = 0;
    pid_t waited = 0;
    while (!result.timed_out) {
        waited = waitpid(pid, &status, WNOHANG);
        if (waited != 0 && !(waited < 0 && errno == EINTR)) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (result.timed_out) {
        log_warn("%s exceeded %llds, killing pid %d", argv[0].c_str(),
                 static_cast<long long>(timeout.count()), pid);
        kill(pid, SIGKILL);
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
    }

    if (waited == pid) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    } else if (waited < 0) {
        // Exit status is unrecoverable (e.g. ECHILD when SIGCHLD is ignored)
        log_error("waitpid for %s (pid %d) failed: %s", argv[0].c_str(), pid,
                  strerror(errno));
        result.exit_code = -1;
    }
    return result;
}

}  // namespace mediavault

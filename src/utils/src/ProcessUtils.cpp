#include "ProcessUtils.hpp"
#include "ProcessErrors.hpp"
#include "LogUtils.hpp"
#include <cerrno>
#include <string>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ProcessUtils {

namespace {

class FdGuard {
public:
    FdGuard() = default;
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    int* receive() { return &fd_; }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FdGuard read_end;
    FdGuard write_end;

    void open() {
        int fds[2];
        // Close-on-exec so children spawned concurrently by other threads do not inherit it
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw ProcessSpawnError("pipe creation failed: " + std::system_category().message(errno));
        }
        *read_end.receive() = fds[0];
        *write_end.receive() = fds[1];
    }
};

std::string errno_message(int err) {
    return std::system_category().message(err);
}

int wait_for_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProcessSpawnError("waitpid failed: " + errno_message(errno));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Drain both pipes until EOF on each; polling keeps a full stderr pipe from
// blocking a child that is still writing stdout.
void drain_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {
        {out_fd, POLLIN, 0},
        {err_fd, POLLIN, 0}
    };
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ProcessSpawnError("poll failed: " + errno_message(errno));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

}

ProcessResult run_capture(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw ProcessSpawnError("cannot run an empty command");
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    Pipe out_pipe, err_pipe, exec_pipe;
    out_pipe.open();
    err_pipe.open();
    exec_pipe.open();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessSpawnError("fork failed: " + errno_message(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (::dup2(out_pipe.write_end.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err_pipe.write_end.get(), STDERR_FILENO) < 0) {
            int err = errno;
            ssize_t ignored = ::write(exec_pipe.write_end.get(), &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    exec_pipe.write_end.reset();

    // The exec pipe closes without data once execvp succeeds
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_for_child(pid);
        throw ProcessSpawnError("failed to launch '" + argv[0] + "': " + errno_message(exec_errno));
    }

    ProcessResult result;
    try {
        drain_pipes(out_pipe.read_end.get(), err_pipe.read_end.get(), result.stdout_text, result.stderr_text);
    } catch (const ProcessSpawnError&) {
        out_pipe.read_end.reset();
        err_pipe.read_end.reset();
        wait_for_child(pid);
        throw;
    }

    result.exit_code = wait_for_child(pid);
    LogUtils::debug("Process '{}' (pid {}) exited with code {}", argv[0], pid, result.exit_code);
    return result;
}

}

#include "common/subprocess.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cvault {

namespace {

// Exit status the child uses when execvp() itself fails.
constexpr int kExecFailedStatus = 127;

std::error_code errno_error() {
    return {errno, std::system_category()};
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

// Drain both pipes until EOF on each.
[[nodiscard]] std::error_code drain(int out_fd, int err_fd, ProcessResult& result) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    int open_count = 2;
    char buf[8192];

    while (open_count > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return errno_error();
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            auto n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                return errno_error();
            }
            if (n == 0) {
                fds[i].fd = -1;  // poll() ignores negative descriptors
                --open_count;
                continue;
            }
            sinks[i]->append(buf, static_cast<std::size_t>(n));
        }
    }
    return {};
}

} // anonymous namespace

std::error_code run_process(const std::vector<std::string>& argv,
                            ProcessResult& result) {
    result = {};
    if (argv.empty()) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // carries the child's errno if exec fails
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        auto ec = errno_error();
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return ec;
    }

    // Build argv before forking: only async-signal-safe calls in the child.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        c_argv.push_back(const_cast<char*>(a.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto ec = errno_error();
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return ec;
    }

    if (pid == 0) {
        // Child process.
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        int saved = errno;
        auto unused = ::write(exec_pipe[1], &saved, sizeof(saved));
        (void)unused;
        _exit(kExecFailedStatus);
    }

    // Parent process.
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    auto drain_ec = drain(out_pipe[0], err_pipe[0], result);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        return errno_error();
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return {exec_errno, std::system_category()};
    }
    if (drain_ec) {
        return drain_ec;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return {};
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace cvault

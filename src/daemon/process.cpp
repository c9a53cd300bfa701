#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace process {

namespace {

// Sentinel exit code used by the child when exec fails.
constexpr int kExecFailed = 127;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

std::expected<ProcessResult, std::string> run(const std::vector<std::string>& argv) {
    std::string out;
    auto result = run(argv, [&out](const char* data, size_t size) { out.append(data, size); });
    if (result) result->out = std::move(out);
    return result;
}

std::expected<ProcessResult, std::string> run(const std::vector<std::string>& argv,
                                              const OutputSink& on_stdout) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(saved));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(kExecFailed);
    }

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    size_t out_bytes = 0;
    char buf[65536];

    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[2];
        nfds_t n = 0;
        if (out_fd >= 0) fds[n++] = {.fd = out_fd, .events = POLLIN, .revents = 0};
        if (err_fd >= 0) fds[n++] = {.fd = err_fd, .events = POLLIN, .revents = 0};

        if (::poll(fds, n, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < n; i++) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            bool is_out = fds[i].fd == out_fd;
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                if (is_out) {
                    out_bytes += static_cast<size_t>(r);
                    on_stdout(buf, static_cast<size_t>(r));
                } else {
                    result.err.append(buf, static_cast<size_t>(r));
                }
            } else if (r == 0 || errno != EINTR) {
                close_fd(is_out ? out_fd : err_fd);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }

    result.exit_code = WEXITSTATUS(status);
    if (result.exit_code == kExecFailed && out_bytes == 0 && result.err.empty()) {
        return std::unexpected("failed to execute " + argv[0]);
    }
    return result;
}

} // namespace process

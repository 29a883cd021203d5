#include "process.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace conductor {

namespace {

std::once_flag g_sigpipe_once;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out) {
    if (fd < 0) {
        return;
    }
    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void feed_pipe(int& fd, const std::string& data, size_t& offset) {
    if (fd < 0) {
        return;
    }
    while (offset < data.size()) {
        const ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return;
        }
        break;
    }
    close_fd(fd);
}

} // anonymous namespace

Result<ProcessOutput> run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        return make_error(ErrorType::InvalidArgument, "empty command");
    }
    if (is_cancelled(options.cancel)) {
        ProcessOutput output;
        output.cancelled = true;
        return output;
    }

    if (!options.stdin_data.empty()) {
        // A child that exits early must not take us down on write()
        std::call_once(g_sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // carries errno from a failed exec
    if (pipe(stdin_pipe) != 0 || pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0 ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return make_io_error("Failed to create process pipes");
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    const TimePoint started = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return make_io_error("Failed to fork process");
    }

    if (pid == 0) {
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            int err = errno;
            static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
            _exit(126);
        }
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdin_pipe[0]));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        static_cast<void>(close(exec_pipe[0]));
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        static_cast<void>(write(exec_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got = 0;
    do {
        got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        if (exec_errno == ENOENT) {
            return make_io_error("Command not found: " + argv[0]);
        }
        return make_io_error("Cannot run " + argv[0] + ": " + std::strerror(exec_errno));
    }

    set_nonblocking(stdin_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);
    if (options.stdin_data.empty()) {
        close_fd(stdin_pipe[1]);
    }

    ProcessOutput output;
    size_t stdin_offset = 0;
    bool child_exited = false;
    int status = 0;

    while (stdout_pipe[0] >= 0 || stderr_pipe[0] >= 0 || !child_exited) {
        if (!child_exited && !output.cancelled && is_cancelled(options.cancel)) {
            output.cancelled = true;
            static_cast<void>(kill(pid, SIGKILL));
        }
        if (!child_exited && !output.timed_out && options.timeout_ms > 0 &&
            ms_since(started) > options.timeout_ms) {
            output.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stdin_pipe[1] >= 0) {
            fds[nfds].fd = stdin_pipe[1];
            fds[nfds].events = POLLOUT;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            usleep(10000);
        }

        feed_pipe(stdin_pipe[1], options.stdin_data, stdin_offset);
        drain_pipe(stdout_pipe[0], output.stdout_text);
        drain_pipe(stderr_pipe[0], output.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                close_fd(stdin_pipe[1]);
            }
        }
        // A grandchild holding the pipes open must not outlive the deadline
        if (child_exited && (output.timed_out || output.cancelled)) {
            break;
        }
    }

    close_fd(stdin_pipe[1]);
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }
    output.duration_ms = ms_since(started);
    return output;
}

} // namespace conductor

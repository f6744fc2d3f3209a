#include "toolhub/backend/process.hpp"
#include "toolhub/core/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <string>
#include <vector>

namespace toolhub::backend {

namespace {

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

[[noreturn]] void child_fail(int error_fd) {
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    ::_exit(127);
}

} // anonymous namespace

ChildProcess::~ChildProcess() {
    close_fds();
    if (pid_ > 0 && !try_reap()) {
        kill_now();
    }
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_), stdin_fd_(other.stdin_fd_), stdout_fd_(other.stdout_fd_) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.stdout_fd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        close_fds();
        if (pid_ > 0 && !try_reap()) {
            kill_now();
        }
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

auto ChildProcess::spawn(const LaunchSpec& spec) -> Result<ChildProcess> {
    if (spec.command.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Backend launch spec has no command"));
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(error_pipe, O_CLOEXEC) != 0) {
        auto reason = std::string(std::strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(error_pipe);
        return std::unexpected(make_error(
            ErrorCode::BackendUnavailable, "Failed to create pipes", reason));
    }

    // Build argv/env before forking; the child only calls async-signal-safe
    // functions apart from setenv/execvp.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto reason = std::string(std::strerror(errno));
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(error_pipe);
        return std::unexpected(make_error(
            ErrorCode::BackendUnavailable, "Failed to fork backend process", reason));
    }

    if (pid == 0) {
        // dup2 clears FD_CLOEXEC on the target descriptor.
        if (::dup2(stdin_pipe[0], STDIN_FILENO) < 0) child_fail(error_pipe[1]);
        if (::dup2(stdout_pipe[1], STDOUT_FILENO) < 0) child_fail(error_pipe[1]);

        if (spec.working_dir && !spec.working_dir->empty()) {
            if (::chdir(spec.working_dir->c_str()) != 0) child_fail(error_pipe[1]);
        }
        for (const auto& [key, value] : spec.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(argv[0], argv.data());
        child_fail(error_pipe[1]);
    }

    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    ::close(error_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (n > 0) {
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        return std::unexpected(make_error(
            ErrorCode::BackendUnavailable,
            "Failed to launch backend '" + spec.command + "'",
            std::strerror(child_errno)));
    }

    ChildProcess child;
    child.pid_ = pid;
    child.stdin_fd_ = stdin_pipe[1];
    child.stdout_fd_ = stdout_pipe[0];
    LOG_DEBUG("Spawned backend process {} (pid={})", spec.command, pid);
    return child;
}

auto ChildProcess::release_stdin() -> int {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

auto ChildProcess::release_stdout() -> int {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

auto ChildProcess::try_reap() -> bool {
    if (pid_ <= 0) return true;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        if (r == pid_ && WIFEXITED(status)) {
            LOG_DEBUG("Backend process {} exited with code {}", pid_, WEXITSTATUS(status));
        } else if (r == pid_ && WIFSIGNALED(status)) {
            LOG_DEBUG("Backend process {} killed by signal {}", pid_, WTERMSIG(status));
        }
        pid_ = -1;
        return true;
    }
    return false;
}

void ChildProcess::send_signal(int sig) {
    if (pid_ > 0) {
        ::kill(pid_, sig);
    }
}

void ChildProcess::kill_now() {
    if (pid_ <= 0) return;
    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
}

void ChildProcess::close_fds() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

} // namespace toolhub::backend

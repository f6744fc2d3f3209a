#pragma once

#include <sys/types.h>

#include "toolhub/backend/descriptor.hpp"
#include "toolhub/core/error.hpp"

namespace toolhub::backend {

/// A spawned backend child with piped stdin/stdout. stderr is inherited.
/// The destructor kills and reaps a child that is still running.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    /// Fork and exec `spec.command spec.args...` with `spec.env` merged over
    /// the inherited environment. Exec failures are reported here rather
    /// than surfacing later as an unexplained EOF.
    static auto spawn(const LaunchSpec& spec) -> Result<ChildProcess>;

    [[nodiscard]] auto pid() const -> pid_t { return pid_; }

    /// Hand the pipe ends to the caller, who becomes responsible for closing.
    auto release_stdin() -> int;
    auto release_stdout() -> int;

    /// Reaps the child if it has exited. Returns true when it is gone.
    auto try_reap() -> bool;

    void send_signal(int sig);

    /// SIGKILL and blocking reap.
    void kill_now();

private:
    void close_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
};

} // namespace toolhub::backend

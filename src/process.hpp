#pragma once
#include "error.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace toolhost {

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // overrides on top of the inherited environment
    std::string cwd;                        // empty = inherit
};

// Parent-side pipe ends of a spawned child. Ownership passes to the caller.
struct ProcessPipes {
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

enum class TerminationPath {
    AlreadyExited,
    Graceful, // exited after SIGTERM within the grace period
    Forced,   // needed SIGKILL
};

// A child process running in its own session. Signals go to the whole
// process group so launcher wrappers do not leave grandchildren behind.
class ChildProcess {
public:
    // Fork and exec. A missing or unrunnable executable is reported as
    // SpawnFailure before this returns.
    static Result<std::unique_ptr<ChildProcess>> spawn(const SpawnOptions& options,
                                                       ProcessPipes& pipes);

    // Kills and reaps the child if it is still running.
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking liveness check; reaps the child if it has exited.
    bool running();

    // Raw wait status once the child has been reaped.
    std::optional<int> wait_status() const;

    // SIGTERM, wait up to `grace`, then SIGKILL. Always reaps.
    TerminationPath terminate(std::chrono::milliseconds grace);

    // Inherited environment merged with `overrides`, as "KEY=VALUE" entries.
    static std::vector<std::string> build_environment(
        const std::map<std::string, std::string>& overrides);

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    bool reap(bool block);
    void signal_group(int sig);

    pid_t pid_;
    mutable std::mutex mutex_;
    bool reaped_ = false;
    int wait_status_ = 0;
};

// Writes to a dead child's stdin must surface as EPIPE, not kill the host.
void ignore_sigpipe();

// "exited with code 3" / "killed by signal 9"
std::string describe_wait_status(int status);

} // namespace toolhost

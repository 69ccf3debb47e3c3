#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace toolhost {

namespace {

enum ChildStage : int { StageChdir = 1, StageExec = 2 };

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

void ignore_sigpipe() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> ChildProcess::build_environment(
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const SpawnOptions& options,
                                                          ProcessPipes& pipes) {
    using R = Result<std::unique_ptr<ChildProcess>>;
    if (options.command.empty()) {
        return R::fail(ErrorKind::SpawnFailure, "No command configured");
    }
    ignore_sigpipe();

    // Everything the child needs is built before fork(); after fork only
    // async-signal-safe calls are allowed.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(options.command);
    argv_storage.insert(argv_storage.end(), options.args.begin(), options.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(options.env);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        return R::fail(ErrorKind::SpawnFailure,
                       std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        return R::fail(ErrorKind::SpawnFailure,
                       std::string("Failed to fork process: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own session so the whole tree can be signalled at once
        setsid();
        int report[2] = {0, 0};
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            report[0] = StageChdir;
            report[1] = errno;
            ssize_t ignored = write(status_pipe[1], report, sizeof(report));
            (void)ignored;
            _exit(126);
        }
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvpe(argv[0], argv.data(), envp.data());
        report[0] = StageExec;
        report[1] = errno;
        ssize_t ignored = write(status_pipe[1], report, sizeof(report));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // EOF here means exec succeeded and CLOEXEC closed the write end.
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_all();
        std::string what = report[0] == StageChdir
            ? "Cannot enter working directory " + options.cwd
            : "Cannot execute " + options.command;
        return R::fail(ErrorKind::SpawnFailure, what + ": " + std::strerror(report[1]));
    }

    pipes.stdin_fd = in_pipe[1];
    pipes.stdout_fd = out_pipe[0];
    pipes.stderr_fd = err_pipe[0];
    return R::ok(std::unique_ptr<ChildProcess>(new ChildProcess(pid)));
}

ChildProcess::~ChildProcess() {
    if (running()) {
        terminate(std::chrono::milliseconds(0));
    }
}

bool ChildProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        reaped_ = true;
        wait_status_ = status;
        return true;
    }
    return false;
}

void ChildProcess::signal_group(int sig) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) return; // pid may already belong to someone else
    }
    if (kill(-pid_, sig) != 0) {
        // setsid() may not have run yet in the child
        kill(pid_, sig);
    }
}

bool ChildProcess::running() {
    return !reap(false);
}

std::optional<int> ChildProcess::wait_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) return std::nullopt;
    return wait_status_;
}

TerminationPath ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (reap(false)) return TerminationPath::AlreadyExited;

    signal_group(SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(false)) return TerminationPath::Graceful;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (reap(false)) return TerminationPath::Graceful;

    signal_group(SIGKILL);
    reap(true);
    return TerminationPath::Forced;
}

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "ended with status " + std::to_string(status);
}

} // namespace toolhost

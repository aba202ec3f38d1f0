#include "forge/process_exec.hpp"

#include "forge/utility.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace forge {

namespace {

volatile sig_atomic_t g_child_pid = 0;
volatile sig_atomic_t g_interrupt = 0;

extern "C" void forward_signal(int sig) {
    g_interrupt = sig;
    pid_t child = g_child_pid;
    if (child > 0)
        kill(child, sig);
}

constexpr std::array FORWARDED_SIGNALS = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

// Installed for the lifetime of one child process. The forwarded signals stay blocked from
// construction until `attach`, so none can arrive while the child pid is unknown.
class SignalForwarder {
public:
    SignalForwarder() {
        g_child_pid = 0;
        g_interrupt = 0;

        sigemptyset(&forwarded_);
        for (int sig : FORWARDED_SIGNALS) {
            sigaddset(&forwarded_, sig);
        }
        pthread_sigmask(SIG_BLOCK, &forwarded_, &saved_mask_);

        run_mask_ = saved_mask_;
        for (int sig : FORWARDED_SIGNALS) {
            sigdelset(&run_mask_, sig);
        }

        struct sigaction sa {};
        sa.sa_handler = forward_signal;
        sigemptyset(&sa.sa_mask);
        for (size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
            sigaction(FORWARDED_SIGNALS[i], &sa, &previous_[i]);
        }
    }

    ~SignalForwarder() {
        pthread_sigmask(SIG_BLOCK, &forwarded_, nullptr);
        for (size_t i = 0; i < FORWARDED_SIGNALS.size(); ++i) {
            sigaction(FORWARDED_SIGNALS[i], &previous_[i], nullptr);
        }
        g_child_pid = 0;
        pthread_sigmask(SIG_SETMASK, &saved_mask_, nullptr);
    }

    // Parent side. Signals that arrived since construction are delivered here, with the child known.
    void attach(pid_t child) {
        g_child_pid = child;
        pthread_sigmask(SIG_SETMASK, &run_mask_, nullptr);
    }

    // Child side, before exec. Default dispositions first, so a pending signal acts on the child.
    void release_in_child() const {
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        sigemptyset(&sa.sa_mask);
        for (int sig : FORWARDED_SIGNALS) {
            sigaction(sig, &sa, nullptr);
        }
        sigprocmask(SIG_SETMASK, &run_mask_, nullptr);
    }

    std::optional<int> interrupt() const {
        if (g_interrupt == 0)
            return std::nullopt;
        return static_cast<int>(g_interrupt);
    }

    SignalForwarder(const SignalForwarder &) = delete;
    SignalForwarder &operator=(const SignalForwarder &) = delete;

private:
    std::array<struct sigaction, FORWARDED_SIGNALS.size()> previous_{};
    sigset_t forwarded_{};
    sigset_t saved_mask_{};
    sigset_t run_mask_{};
};

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) == -1) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    bool valid() const {
        return fds_[0] != -1;
    }
    int read_end() const {
        return fds_[0];
    }
    int write_end() const {
        return fds_[1];
    }
    void close_read() {
        if (fds_[0] != -1)
            close(fds_[0]);
        fds_[0] = -1;
    }
    void close_write() {
        if (fds_[1] != -1)
            close(fds_[1]);
        fds_[1] = -1;
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

private:
    int fds_[2];
};

struct SpawnFailure {
    enum STAGE : int { CHDIR, EXEC } stage;
    int err;
};

Result<int> wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            return fail(ErrorCode::SpawnFailed, "waitpid failed: {}", std::strerror(errno));
    }
    return status;
}

} // namespace

Result<ProcessStatus> process_exec(const std::vector<std::string> &args, const std::filesystem::path &cwd) {
    if (args.empty()) {
        return fail(ErrorCode::SpawnFailed, "Empty command");
    }

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // The child reports a failed chdir/exec through this pipe; a successful exec closes it.
    Pipe report;
    if (!report.valid()) {
        return fail(ErrorCode::SpawnFailed, "Failed to create pipe: {}", std::strerror(errno));
    }

    SignalForwarder forwarder;

    pid_t pid = fork();
    if (pid == -1) {
        return fail(ErrorCode::SpawnFailed, "Failed to fork for `{}`: {}", args[0], std::strerror(errno));
    }

    if (pid == 0) {
        forwarder.release_in_child();
        SpawnFailure failure{SpawnFailure::EXEC, 0};
        if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
            failure = {SpawnFailure::CHDIR, errno};
        } else {
            execvp(argv[0], argv.data());
            failure.err = errno;
        }
        [[maybe_unused]] auto n = write(report.write_end(), &failure, sizeof(failure));
        _exit(127);
    }

    forwarder.attach(pid);
    report.close_write();

    SpawnFailure failure{};
    ssize_t n;
    do {
        n = read(report.read_end(), &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);

    auto status = wait_for(pid);
    if (!status)
        return std::unexpected(status.error());

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        if (failure.stage == SpawnFailure::CHDIR) {
            return fail(ErrorCode::SpawnFailed, "Failed to enter working directory `{}`: {}", cwd.string(),
                        std::strerror(failure.err));
        }
        return fail(ErrorCode::SpawnFailed, "Failed to execute `{}`: {}", args[0], std::strerror(failure.err));
    }

    ProcessStatus result;
    if (WIFEXITED(*status)) {
        result.code = WEXITSTATUS(*status);
    } else if (WIFSIGNALED(*status)) {
        result.signal = WTERMSIG(*status);
    }
    result.interrupt = forwarder.interrupt();
    return result;
}

} // namespace forge

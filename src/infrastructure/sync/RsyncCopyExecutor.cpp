#include "infrastructure/sync/RsyncCopyExecutor.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace parasync::infrastructure::sync {

using domain::sync::CopyOutcome;
using domain::sync::CopyRequest;

namespace {

/**
 * Owns a spawned child and the read end of its output pipe. If the child is
 * still unreaped on destruction its process group is killed and reaped.
 */
class ChildProcess {
public:
    ChildProcess(pid_t pid, int outputFd) : m_pid(pid), m_fd(outputFd) {}
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ~ChildProcess() {
        closeOutput();
        if (!m_reaped) {
            ::kill(-m_pid, SIGKILL);
            int status = 0;
            while (::waitpid(m_pid, &status, 0) == -1 && errno == EINTR) {
            }
        }
    }

    int outputFd() const { return m_fd; }

    void closeOutput() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    void signalGroup(int sig) { ::kill(-m_pid, sig); }

    /// True once the child is gone. status is -1 if waitpid lost track of it.
    bool tryReap(int& status) {
        int raw = 0;
        pid_t r = ::waitpid(m_pid, &raw, WNOHANG);
        if (r == m_pid) {
            m_reaped = true;
            status = raw;
            return true;
        }
        if (r == -1 && errno != EINTR) {
            m_reaped = true;
            status = -1;
            return true;
        }
        return false;
    }

private:
    pid_t m_pid;
    int m_fd;
    bool m_reaped = false;
};

std::string ErrnoText(int err) {
    return std::strerror(err);
}

} // namespace

RsyncCopyExecutor::RsyncCopyExecutor(std::string binaryPath, std::chrono::milliseconds stopGrace)
    : m_binaryPath(std::move(binaryPath)), m_stopGrace(stopGrace) {}

std::vector<std::string> RsyncCopyExecutor::buildArguments(const CopyRequest& request) const {
    std::vector<std::string> args;
    args.push_back(m_binaryPath);
    for (const auto& opt : request.options) {
        args.push_back(opt);
    }
    for (const auto& pattern : request.excludePatterns) {
        args.push_back("--exclude");
        args.push_back(pattern);
    }
    args.push_back(request.sourcePath);
    args.push_back(request.destPath);
    return args;
}

CopyOutcome RsyncCopyExecutor::execute(const CopyRequest& request, OnLine onLine, ShouldStop shouldStop) {
    CopyOutcome outcome;

    std::vector<std::string> args = buildArguments(request);
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        outcome.exitCode = -1;
        outcome.errorMessage = "pipe failed for copy tool: " + ErrnoText(errno);
        return outcome;
    }

    // stdin from /dev/null, stdout and stderr into the pipe.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

    // Own process group so a stop reaches the tool's helpers too. The service
    // blocks SIGINT/SIGTERM for its signal thread; the child must not inherit that.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&attr, 0);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    posix_spawnattr_setsigmask(&attr, &emptyMask);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    ::close(fds[1]);

    if (rc != 0) {
        ::close(fds[0]);
        outcome.exitCode = 127;
        outcome.errorMessage = "failed to start copy tool " + m_binaryPath + ": " + ErrnoText(rc);
        return outcome;
    }

    ChildProcess child(pid, fds[0]);

    using SteadyClock = std::chrono::steady_clock;
    bool stopping = false;
    bool killed = false;
    SteadyClock::time_point killAt;

    // progress2 separates updates with '\r', so both '\r' and '\n' end a line.
    std::string pending;
    auto flushPending = [&]() {
        if (!pending.empty() && onLine) onLine(pending);
        pending.clear();
    };

    int status = 0;
    bool reaped = false;
    char buffer[4096];
    while (!reaped) {
        if (!stopping && shouldStop && shouldStop()) {
            stopping = true;
            outcome.stopped = true;
            child.signalGroup(SIGTERM);
            killAt = SteadyClock::now() + m_stopGrace;
        }
        if (stopping && !killed && SteadyClock::now() >= killAt) {
            child.signalGroup(SIGKILL);
            killed = true;
        }

        if (child.outputFd() < 0) {
            reaped = child.tryReap(status);
            if (!reaped) std::this_thread::sleep_for(std::chrono::milliseconds(20));
            continue;
        }

        pollfd pfd{child.outputFd(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            outcome.exitCode = -1;
            outcome.errorMessage = "poll failed on copy tool output: " + ErrnoText(errno);
            return outcome;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(child.outputFd(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            child.closeOutput();
            flushPending();
            continue;
        }
        if (n == 0) {
            child.closeOutput();
            flushPending();
            continue;
        }
        for (ssize_t i = 0; i < n; ++i) {
            char c = buffer[i];
            if (c == '\r' || c == '\n') {
                flushPending();
            } else {
                pending += c;
            }
        }
    }

    if (status == -1) {
        outcome.exitCode = -1;
        outcome.errorMessage = "lost track of copy tool process";
    } else if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exitCode = 128 + WTERMSIG(status);
    } else {
        outcome.exitCode = -1;
    }
    return outcome;
}

} // namespace parasync::infrastructure::sync

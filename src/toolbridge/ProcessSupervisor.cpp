//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.cpp
// Purpose: fork/exec child spawning with piped stdio and bounded-time teardown
//==========================================================================================================

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <utility>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include "toolbridge/ProcessSupervisor.h"
#include "toolbridge/errors/Errors.h"
#include "logging/Logger.h"

extern char** environ;

namespace toolbridge {

namespace {
constexpr std::chrono::milliseconds ExitPollInterval{10};

// Written by the child to the status pipe when setup or exec fails.
struct ChildFailure {
    int stage;  // 1 = chdir, 2 = exec
    int err;
};

class FdSet {
public:
    ~FdSet() {
        for (int fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }
    bool MakePipe(int (&p)[2]) {
        if (::pipe2(p, O_CLOEXEC) != 0) return false;
        fds.push_back(p[0]);
        fds.push_back(p[1]);
        return true;
    }
    // Stops tracking fd (ownership moves elsewhere or it was closed manually).
    int Release(int fd) {
        for (int& f : fds) {
            if (f == fd) f = -1;
        }
        return fd;
    }
    void Close(int fd) {
        ::close(Release(fd));
    }

private:
    std::vector<int> fds;
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::vector<std::string> out;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = (eq == std::string::npos) ? entry : entry.substr(0, eq);
        if (overlay.count(key) != 0) continue;
        out.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overlay) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> toCharArray(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

void ignoreSigpipeOnce() {
    static const bool installed = []() {
        ::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)installed;
}
} // namespace

std::string ErrnoName(int err) {
    switch (err) {
        case ENOENT: return "ENOENT";
        case EACCES: return "EACCES";
        case EPERM: return "EPERM";
        case ENOEXEC: return "ENOEXEC";
        case ENOTDIR: return "ENOTDIR";
        case EISDIR: return "EISDIR";
        case ENOMEM: return "ENOMEM";
        case EMFILE: return "EMFILE";
        case EAGAIN: return "EAGAIN";
        case E2BIG: return "E2BIG";
        case ELOOP: return "ELOOP";
        case ENAMETOOLONG: return "ENAMETOOLONG";
        default: return fmt::format("errno={}", err);
    }
}

std::string ExitStatus::Describe() const {
    if (signal.has_value()) {
        return fmt::format("terminated by signal {}", signal.value());
    }
    return fmt::format("exited with code {}", code);
}

ChildProcess::ChildProcess(const net::any_io_executor& executor, pid_t pid, int stdinFd, int stdoutFd,
                           int stderrFd, std::string label)
    : pid(pid), label(std::move(label)),
      stdinPipe(executor, stdinFd), stdoutPipe(executor, stdoutFd), stderrPipe(executor, stderrFd) {}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const net::any_io_executor& executor, const SpawnOptions& options) {
    FUNC_SCOPE();
    using errors::ErrorKind;
    using errors::ToolBridgeError;

    ignoreSigpipeOnce();

    // Prepare everything that allocates before fork
    std::vector<std::string> argvStore;
    argvStore.push_back(options.command);
    argvStore.insert(argvStore.end(), options.args.begin(), options.args.end());
    std::vector<std::string> envStore = buildEnvironment(options.env);
    std::vector<char*> argv = toCharArray(argvStore);
    std::vector<char*> envp = toCharArray(envStore);
    const char* cwd = options.cwd.has_value() ? options.cwd->c_str() : nullptr;

    FdSet fds;
    int inPipe[2], outPipe[2], errPipe[2], statusPipe[2];
    if (!fds.MakePipe(inPipe) || !fds.MakePipe(outPipe) || !fds.MakePipe(errPipe) || !fds.MakePipe(statusPipe)) {
        const int err = errno;
        throw ToolBridgeError(ErrorKind::SpawnFailure,
                              fmt::format("Failed to create pipes for '{}': {} ({})", options.command,
                                          std::strerror(err), ErrnoName(err)));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        throw ToolBridgeError(ErrorKind::SpawnFailure,
                              fmt::format("Failed to fork for '{}': {} ({})", options.command,
                                          std::strerror(err), ErrnoName(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ChildFailure failure{0, 0};
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            failure = ChildFailure{1, errno};
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            failure = ChildFailure{2, errno};
        }
        ssize_t ignored = ::write(statusPipe[1], &failure, sizeof(failure));
        (void)ignored;
        ::_exit(127);
    }

    // Parent; setpgid is repeated here so the group exists before any signal is sent
    (void)::setpgid(pid, pid);
    fds.Close(inPipe[0]);
    fds.Close(outPipe[1]);
    fds.Close(errPipe[1]);
    fds.Close(statusPipe[1]);

    ChildFailure failure{0, 0};
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (failure.stage == 1) {
            throw ToolBridgeError(ErrorKind::SpawnFailure,
                                  fmt::format("Failed to change directory to '{}' for '{}': {} ({})",
                                              options.cwd.value_or(""), options.command,
                                              std::strerror(failure.err), ErrnoName(failure.err)));
        }
        throw ToolBridgeError(ErrorKind::SpawnFailure,
                              fmt::format("Failed to spawn '{}': {} ({})", options.command,
                                          std::strerror(failure.err), ErrnoName(failure.err)));
    }

    LOG_DEBUG("[{}] spawned '{}' pid={}", options.label, options.command, pid);
    return std::unique_ptr<ChildProcess>(new ChildProcess(
        executor, pid, fds.Release(inPipe[1]), fds.Release(outPipe[0]), fds.Release(errPipe[0]), options.label));
}

ChildProcess::~ChildProcess() {
    if (!exitStatus.has_value()) {
        TerminateNow(std::chrono::milliseconds(500));
    } else {
        ClosePipes();
    }
}

bool ChildProcess::tryReap(bool block) {
    if (exitStatus.has_value()) return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) return false;
    if (r < 0) {
        // Already reaped elsewhere; the exit code is unknown
        LOG_WARN("[{}] waitpid({}) failed: {}", label, pid, std::strerror(errno));
        exitStatus = ExitStatus{-1, std::nullopt};
        return true;
    }
    ExitStatus es;
    if (WIFEXITED(status)) {
        es.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        es.signal = WTERMSIG(status);
        es.code = 128 + es.signal.value();
    }
    exitStatus = es;
    LOG_DEBUG("[{}] pid {} {}", label, pid, es.Describe());
    return true;
}

bool ChildProcess::IsRunning() {
    return !tryReap(false);
}

void ChildProcess::signalChild(int sig) {
    if (exitStatus.has_value()) return;
    // The child leads its own process group; signal the group so package-runner shims take their children along
    if (::kill(-pid, sig) != 0) {
        ::kill(pid, sig);
    }
}

void ChildProcess::AppendStderr(const char* data, std::size_t size) {
    stderrTail.append(data, size);
    if (stderrTail.size() > StderrTailLimit) {
        stderrTail.erase(0, stderrTail.size() - StderrTailLimit);
    }
}

std::string ChildProcess::StderrTail(std::size_t maxChars) const {
    if (stderrTail.size() <= maxChars) return stderrTail;
    return stderrTail.substr(stderrTail.size() - maxChars);
}

void ChildProcess::ClosePipes() {
    boost::system::error_code ec;
    if (stdinPipe.is_open()) stdinPipe.close(ec);
    if (stdoutPipe.is_open()) stdoutPipe.close(ec);
    if (stderrPipe.is_open()) stderrPipe.close(ec);
}

net::awaitable<std::optional<ExitStatus>> ChildProcess::AsyncWaitExit(std::chrono::milliseconds timeout) {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!tryReap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return std::nullopt;
        }
        timer.expires_after(ExitPollInterval);
        co_await timer.async_wait(net::use_awaitable);
    }
    co_return exitStatus;
}

net::awaitable<void> ChildProcess::AsyncTerminate(std::chrono::milliseconds grace) {
    ClosePipes();
    if (tryReap(false)) co_return;
    signalChild(SIGTERM);
    auto status = co_await AsyncWaitExit(grace);
    if (!status.has_value()) {
        LOG_WARN("[{}] pid {} ignored SIGTERM for {}ms; sending SIGKILL", label, pid, grace.count());
        signalChild(SIGKILL);
        tryReap(true);
    }
    co_return;
}

void ChildProcess::TerminateNow(std::chrono::milliseconds grace) {
    ClosePipes();
    if (tryReap(false)) return;
    signalChild(SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (!tryReap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("[{}] pid {} ignored SIGTERM for {}ms; sending SIGKILL", label, pid, grace.count());
            signalChild(SIGKILL);
            tryReap(true);
            return;
        }
        std::this_thread::sleep_for(ExitPollInterval);
    }
}

} // namespace toolbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessSupervisor.h
// Purpose: Child process spawning over stdio pipes, stderr tail capture, exit observation and teardown
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

namespace toolbridge {

namespace net = boost::asio;

//==========================================================================================================
// SpawnOptions
// Purpose: Fully resolved launch description for one child.
// Fields:
//   command: Executable name (searched on PATH) or path.
//   args: Arguments after argv[0].
//   env: Variables overlaid on the inherited environment.
//   cwd: Working directory for the child; inherited when unset.
//   label: Name used in log lines (server name).
//==========================================================================================================
struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
    std::string label;
};

//==========================================================================================================
// ExitStatus
// Purpose: Decoded waitpid status.
//==========================================================================================================
struct ExitStatus {
    int code{0};                 // exit code, or 128 + signal when killed by a signal
    std::optional<int> signal;   // terminating signal, when any

    std::string Describe() const;
};

//==========================================================================================================
// ChildProcess
// Purpose: Owns one spawned child and the parent ends of its stdin/stdout/stderr pipes.
// Notes:
//   - Spawn reports exec/chdir failures synchronously as ToolBridgeError(SpawnFailure).
//   - The destructor terminates and reaps a still-running child (blocking, bounded by a short grace).
//==========================================================================================================
class ChildProcess {
public:
    static constexpr std::size_t StderrTailLimit = 8 * 1024;

    //======================================================================================================
    // Spawn
    // Purpose: fork/exec the child with piped stdio.
    // Args:
    //   executor: Executor the pipe descriptors are bound to.
    //   options: Launch description.
    // Returns:
    //   Running child.
    // Throws:
    //   errors::ToolBridgeError(SpawnFailure) when pipes, fork, chdir or exec fail; the message carries the
    //   errno name (e.g. ENOENT).
    //======================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(const net::any_io_executor& executor, const SpawnOptions& options);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid; }
    const std::string& Label() const { return label; }

    net::posix::stream_descriptor& Stdin() { return stdinPipe; }
    net::posix::stream_descriptor& Stdout() { return stdoutPipe; }
    net::posix::stream_descriptor& Stderr() { return stderrPipe; }

    // Non-blocking liveness check; reaps the child when it has exited.
    bool IsRunning();
    std::optional<ExitStatus> GetExitStatus() const { return exitStatus; }

    // Bounded stderr capture (never parsed as protocol).
    void AppendStderr(const char* data, std::size_t size);
    std::string StderrTail(std::size_t maxChars) const;

    //======================================================================================================
    // AsyncWaitExit
    // Purpose: Polls for exit without blocking the event loop.
    // Returns:
    //   ExitStatus when the child exited within timeout; std::nullopt otherwise.
    //======================================================================================================
    net::awaitable<std::optional<ExitStatus>> AsyncWaitExit(std::chrono::milliseconds timeout);

    //======================================================================================================
    // AsyncTerminate
    // Purpose: Closes pipes, sends SIGTERM, waits up to grace, then SIGKILL and reap.
    //======================================================================================================
    net::awaitable<void> AsyncTerminate(std::chrono::milliseconds grace);

    // Blocking variant of AsyncTerminate for destructors and non-coroutine teardown.
    void TerminateNow(std::chrono::milliseconds grace);

    // Closes the parent ends of all pipes (cancels pending reads/writes).
    void ClosePipes();

private:
    ChildProcess(const net::any_io_executor& executor, pid_t pid, int stdinFd, int stdoutFd, int stderrFd,
                 std::string label);

    bool tryReap(bool block);
    void signalChild(int sig);

    pid_t pid{-1};
    std::string label;
    net::posix::stream_descriptor stdinPipe;
    net::posix::stream_descriptor stdoutPipe;
    net::posix::stream_descriptor stderrPipe;
    std::optional<ExitStatus> exitStatus;
    std::string stderrTail;
};

// Symbolic errno name (e.g. "ENOENT"), or "errno=N" for codes without one.
std::string ErrnoName(int err);

} // namespace toolbridge

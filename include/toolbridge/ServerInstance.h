//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerInstance.h
// Purpose: One live tool server connection: stdio framing, request correlation, crash observation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/LineCodec.h"
#include "toolbridge/PendingRequests.h"
#include "toolbridge/ProcessSupervisor.h"
#include "toolbridge/Protocol.h"

namespace toolbridge {

namespace net = boost::asio;

//==========================================================================================================
// ServerInstance
// Purpose: Owns a spawned child and speaks line-delimited JSON-RPC with it.
// Notes:
//   - The stdout reader only decodes frames; each frame is posted to the dispatcher, which performs
//     correlation against the pending table.
//   - When the child closes its output (exit or crash) the instance flips to disconnected, records
//     lastError on non-zero exit, and rejects all pending requests with ProcessCrash.
//   - All members are touched only from the owning executor.
//==========================================================================================================
class ServerInstance : public std::enable_shared_from_this<ServerInstance> {
public:
    static constexpr std::size_t LastErrorStderrChars = 500;

    ServerInstance(std::string name, const net::any_io_executor& executor, std::unique_ptr<ChildProcess> process);
    ~ServerInstance();

    ServerInstance(const ServerInstance&) = delete;
    ServerInstance& operator=(const ServerInstance&) = delete;

    // Starts the stdout and stderr reader coroutines.
    void Start();

    //======================================================================================================
    // Request
    // Purpose: Sends a request with the next id and awaits its response.
    // Args:
    //   method: JSON-RPC method.
    //   params: Optional params object.
    //   timeout: Per-request deadline.
    // Returns:
    //   The "result" member of the response.
    // Throws:
    //   ToolBridgeError(RequestTimeout | RemoteRpcError | ProcessCrash | TransportClosed).
    //======================================================================================================
    net::awaitable<JSONValue> Request(std::string method, std::optional<JSONValue> params,
                                      std::chrono::milliseconds timeout);

    // Fire-and-forget notification.
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //======================================================================================================
    // Close
    // Purpose: Stops I/O. Pending requests are rejected with TransportClosed; the process is left running.
    //======================================================================================================
    void Close(const std::string& reason);

    // Close, then terminate and reap the child (SIGTERM, grace, SIGKILL).
    net::awaitable<void> AsyncShutdown(std::chrono::milliseconds grace);
    void ShutdownNow(std::chrono::milliseconds grace);

    const std::string& Name() const { return name; }
    bool IsConnected() const { return connected; }
    void SetConnected(bool value) { connected = value; }
    bool IsProcessAlive() { return process->IsRunning(); }
    bool IsClosed() const { return closing; }

    const std::optional<std::string>& LastError() const { return lastError; }
    void SetLastError(std::string message) { lastError = std::move(message); }

    // Flags the connection unusable after a failed request.
    void MarkFailed(const std::string& message);

    const std::vector<Tool>& Tools() const { return tools; }
    void SetTools(std::vector<Tool> value) { tools = std::move(value); }

    std::size_t PendingCount() const { return pending.Size(); }
    ChildProcess& Process() { return *process; }

private:
    net::awaitable<void> readStdout();
    net::awaitable<void> readStderr();
    net::awaitable<void> drainWrites();
    net::awaitable<void> onOutputClosed();

    void dispatchFrame(const JSONValue& frame);
    void enqueueWrite(std::string frame);
    void failTransport(const std::string& message, errors::ErrorKind kind);

    std::string name;
    net::any_io_executor executor;
    std::unique_ptr<ChildProcess> process;
    PendingRequests<JSONValue> pending;
    LineSplitter splitter;
    std::deque<std::string> writeQueue;
    bool writing{false};
    bool closing{false};
    bool stderrClosed{false};
    bool connected{false};
    int64_t nextRequestId{1};
    std::vector<Tool> tools;
    std::optional<std::string> lastError;
};

} // namespace toolbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolClient.h
// Purpose: Registry of stdio tool servers with connect, tool invocation, one-shot reconnect and teardown
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/Protocol.h"
#include "toolbridge/ServerConfig.h"

namespace toolbridge {

namespace net = boost::asio;

//==========================================================================================================
// ToolClientOptions
// Purpose: Timeouts, identity and command resolution for a ToolClient.
// Fields:
//   handshakeTimeout: Deadline for each of initialize and tools/list.
//   callTimeout: Deadline for tools/call.
//   spawnSettle: Delay after spawn before the handshake; a child that exits within it fails connect.
//   terminateGrace: SIGTERM-to-SIGKILL window during teardown.
//   protocolVersion / clientInfo: Sent in initialize.
//   resolver: Command rewrite strategy; PackageRunnerResolver when null.
//==========================================================================================================
struct ToolClientOptions {
    std::chrono::milliseconds handshakeTimeout{10000};
    std::chrono::milliseconds callTimeout{60000};
    std::chrono::milliseconds spawnSettle{500};
    std::chrono::milliseconds terminateGrace{2000};
    std::string protocolVersion{PROTOCOL_VERSION};
    Implementation clientInfo;
    std::shared_ptr<ICommandResolver> resolver;

    ToolClientOptions();

    // Defaults overridden by TOOLBRIDGE_HANDSHAKE_TIMEOUT_MS, TOOLBRIDGE_CALL_TIMEOUT_MS and
    // TOOLBRIDGE_SPAWN_SETTLE_MS when set.
    static ToolClientOptions FromEnvironment();
};

enum class ServerState {
    Absent,
    Connecting,
    Connected,
    Disconnected
};

const char* serverStateToString(ServerState state);

struct ServerStatus {
    std::string name;
    bool connected{false};
    std::size_t toolCount{0};
    std::optional<std::string> error;
};

//==========================================================================================================
// ToolClient
// Purpose: Owns every live server instance for one session.
// Notes:
//   - Single-threaded: all work runs on one io_context (owned, or supplied by the caller).
//   - Co* members are coroutines for use inside that io_context; the plain members drive the
//     io_context until the operation completes and must be called from outside it.
//   - Destruction tears down every child process (blocking, bounded by terminateGrace).
//==========================================================================================================
class ToolClient {
public:
    explicit ToolClient(ToolBridgeConfig config, ToolClientOptions options = ToolClientOptions::FromEnvironment());
    ToolClient(net::io_context& ioc, ToolBridgeConfig config,
               ToolClientOptions options = ToolClientOptions::FromEnvironment());
    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    net::io_context& GetIoContext();

    ////////////////////////////////////////// Configuration ///////////////////////////////////////////
    // Configured server names (sorted), independent of connectivity.
    std::vector<std::string> ListServers() const;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Connects to a configured server: spawn, settle, handshake, publish.
    // Args:
    //   name: Server name from the config.
    // Returns:
    //   Tools advertised by the server (cached tools when already connected).
    // Throws:
    //   errors::ToolBridgeError (ConfigAbsent, SpawnFailure, HandshakeTimeout, ProcessCrash, ...).
    //   On failure no registry entry remains for the name.
    //==========================================================================================================
    net::awaitable<std::vector<Tool>> CoConnect(std::string name);
    std::vector<Tool> Connect(const std::string& name);

    //==========================================================================================================
    // Terminates one server and removes it from the registry; pending requests are rejected.
    //==========================================================================================================
    net::awaitable<void> CoDisconnect(std::string name);
    void Disconnect(const std::string& name);

    //==========================================================================================================
    // Terminates every server and clears the registry. Every pending request is settled (rejected)
    // before this returns and no deadline timers remain armed.
    //==========================================================================================================
    net::awaitable<void> CoDisconnectAll();
    void DisconnectAll();

    ////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // Invokes a tool. A missing or disconnected server gets exactly one reconnect attempt first.
    // Args:
    //   name: Server name.
    //   toolName: Tool to call.
    //   arguments: Arguments object.
    // Returns:
    //   ToolCallResult; failures are reported with isError=true. Never throws.
    //==========================================================================================================
    net::awaitable<ToolCallResult> CoCallTool(std::string name, std::string toolName, JSONValue arguments);
    ToolCallResult CallTool(const std::string& name, const std::string& toolName, const JSONValue& arguments);

    ////////////////////////////////////////// Status ///////////////////////////////////////////
    // Names of servers that are connected and whose process is alive.
    std::vector<std::string> GetConnectedServers() const;
    // Tools per connected server.
    std::map<std::string, std::vector<Tool>> GetAllTools() const;
    std::size_t GetTotalToolCount() const;
    bool IsServerConnected(const std::string& name) const;
    std::optional<std::string> GetServerError(const std::string& name) const;
    ServerState GetServerState(const std::string& name) const;
    // One entry per configured server.
    std::vector<ServerStatus> GetServerStatuses() const;
    // Outstanding requests for a live instance (0 when absent).
    std::size_t GetPendingRequestCount(const std::string& name) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ScopedDisconnect
// Purpose: RAII guard that calls DisconnectAll on every exit path of the enclosing scope.
//==========================================================================================================
class ScopedDisconnect {
public:
    explicit ScopedDisconnect(ToolClient& client) : client(client) {}
    ~ScopedDisconnect();

    ScopedDisconnect(const ScopedDisconnect&) = delete;
    ScopedDisconnect& operator=(const ScopedDisconnect&) = delete;

private:
    ToolClient& client;
};

} // namespace toolbridge

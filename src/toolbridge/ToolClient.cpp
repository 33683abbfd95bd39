//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolClient.cpp
// Purpose: Server registry, connect/reconnect orchestration and teardown
//==========================================================================================================

#include <functional>

#include <utility>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>

#include "toolbridge/ToolClient.h"
#include "toolbridge/Handshake.h"
#include "toolbridge/ProcessSupervisor.h"
#include "toolbridge/ServerInstance.h"
#include "toolbridge/ToolInvoker.h"
#include "toolbridge/async/Blocking.h"
#include "toolbridge/errors/ErrorClassifier.h"
#include "toolbridge/errors/Errors.h"
#include "toolbridge/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace toolbridge {

using errors::ErrorKind;
using errors::ToolBridgeError;

namespace {
constexpr std::size_t ExitedImmediatelyStderrChars = 200;

void applyEnvMillis(const char* name, std::chrono::milliseconds& target) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) return;
    auto v = GetEnvMillis(name);
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed {}={}", name, raw);
        return;
    }
    target = v.value();
}

std::string describeException(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

// Callers that arrive while a connect for the same name is in flight wait for its outcome.
// A disconnect reaches the not-yet-published instance and settle timer through the attempt.
struct ConnectAttempt {
    using Waiter = std::function<void(std::exception_ptr, std::vector<Tool>)>;
    std::vector<Waiter> waiters;
    bool cancelled{false};
    bool finished{false};
    std::shared_ptr<ServerInstance> instance;
    std::unique_ptr<net::steady_timer> settle;
};

template <typename CompletionToken>
auto asyncJoinAttempt(std::shared_ptr<ConnectAttempt> attempt, CompletionToken&& token) {
    return net::async_initiate<CompletionToken, void(std::exception_ptr, std::vector<Tool>)>(
        [attempt](auto handler) {
            auto shared = std::make_shared<decltype(handler)>(std::move(handler));
            attempt->waiters.push_back([shared](std::exception_ptr e, std::vector<Tool> tools) {
                (*shared)(e, std::move(tools));
            });
        },
        token);
}
} // namespace

////////////////////////////////////////// ToolClientOptions ///////////////////////////////////////////

ToolClientOptions::ToolClientOptions() : clientInfo("toolbridge", getVersionString()) {}

ToolClientOptions ToolClientOptions::FromEnvironment() {
    ToolClientOptions opts;
    applyEnvMillis("TOOLBRIDGE_HANDSHAKE_TIMEOUT_MS", opts.handshakeTimeout);
    applyEnvMillis("TOOLBRIDGE_CALL_TIMEOUT_MS", opts.callTimeout);
    applyEnvMillis("TOOLBRIDGE_SPAWN_SETTLE_MS", opts.spawnSettle);
    return opts;
}

const char* serverStateToString(ServerState state) {
    switch (state) {
        case ServerState::Absent: return "absent";
        case ServerState::Connecting: return "connecting";
        case ServerState::Connected: return "connected";
        case ServerState::Disconnected: return "disconnected";
    }
    return "unknown";
}

////////////////////////////////////////// Impl ///////////////////////////////////////////

class ToolClient::Impl {
public:
    // Declared first so an owned io_context outlives every instance below
    std::unique_ptr<net::io_context> ownedIoc;
    net::io_context& ioc;
    ToolBridgeConfig config;
    ToolClientOptions options;
    std::map<std::string, std::shared_ptr<ServerInstance>> servers;
    std::map<std::string, std::shared_ptr<ConnectAttempt>> attempts;

    Impl(std::unique_ptr<net::io_context> owned, net::io_context* external, ToolBridgeConfig cfg,
         ToolClientOptions opts)
        : ownedIoc(std::move(owned)), ioc(external ? *external : *ownedIoc),
          config(std::move(cfg)), options(std::move(opts)) {
        if (!options.resolver) {
            options.resolver = std::make_shared<PackageRunnerResolver>();
        }
    }

    ~Impl() {
        shutdownNow();
    }

    std::shared_ptr<ServerInstance> usableInstance(const std::string& name) const {
        auto it = servers.find(name);
        if (it == servers.end()) return nullptr;
        if (!it->second->IsConnected() || !it->second->IsProcessAlive()) return nullptr;
        return it->second;
    }

    void completeAttempt(ConnectAttempt& attempt, std::exception_ptr failure, const std::vector<Tool>& tools) {
        attempt.finished = true;
        auto waiters = std::move(attempt.waiters);
        attempt.waiters.clear();
        for (auto& w : waiters) {
            net::post(ioc, [w = std::move(w), failure, tools]() mutable { w(failure, std::move(tools)); });
        }
    }

    net::awaitable<std::vector<Tool>> coConnect(std::string name);
    net::awaitable<std::vector<Tool>> establish(std::string name, ServerConfig cfg,
                                                std::shared_ptr<ConnectAttempt> attempt);
    net::awaitable<ToolCallResult> coCallTool(std::string name, std::string toolName, JSONValue arguments);
    net::awaitable<void> coDisconnect(std::string name);
    net::awaitable<void> coDisconnectAll();
    std::shared_ptr<ServerInstance> cancelAttempt(ConnectAttempt& attempt, const std::string& name);
    net::awaitable<void> awaitCancelledAttempt(std::string name, std::shared_ptr<ConnectAttempt> attempt,
                                               std::shared_ptr<ServerInstance> instance);
    void shutdownNow();
};

net::awaitable<std::vector<Tool>> ToolClient::Impl::coConnect(std::string name) {
    FUNC_SCOPE();
    auto cfgIt = config.find(name);
    if (cfgIt == config.end()) {
        throw ToolBridgeError(ErrorKind::ConfigAbsent, fmt::format("Server \"{}\" not found in config", name));
    }
    if (auto live = usableInstance(name)) {
        co_return live->Tools();
    }
    if (auto inflight = attempts.find(name); inflight != attempts.end()) {
        LOG_DEBUG("Joining in-flight connect for \"{}\"", name);
        auto join = asyncJoinAttempt(inflight->second, net::use_awaitable);
        co_return co_await std::move(join);
    }

    auto attempt = std::make_shared<ConnectAttempt>();
    attempts[name] = attempt;
    std::vector<Tool> tools;
    std::exception_ptr failure;
    try {
        auto connect = establish(name, cfgIt->second, attempt);
        tools = co_await std::move(connect);
    } catch (...) {
        failure = std::current_exception();
    }
    auto current = attempts.find(name);
    if (current != attempts.end() && current->second == attempt) {
        attempts.erase(current);
    }
    completeAttempt(*attempt, failure, tools);
    if (failure) {
        LOG_ERROR("Failed to connect to \"{}\": {}", name, describeException(failure));
        std::rethrow_exception(failure);
    }
    co_return tools;
}

net::awaitable<std::vector<Tool>> ToolClient::Impl::establish(std::string name, ServerConfig cfg,
                                                              std::shared_ptr<ConnectAttempt> attempt) {
    net::any_io_executor executor = ioc.get_executor();

    // A crashed or failed instance is replaced wholesale
    if (auto stale = servers.find(name); stale != servers.end()) {
        auto old = stale->second;
        servers.erase(stale);
        LOG_DEBUG("Discarding disconnected instance for \"{}\"", name);
        co_await old->AsyncShutdown(options.terminateGrace);
    }
    auto throwIfCancelled = [&]() {
        if (attempt->cancelled) {
            throw ToolBridgeError(ErrorKind::TransportClosed,
                                  fmt::format("Connection to \"{}\" cancelled by disconnect", name));
        }
    };
    throwIfCancelled();

    SpawnOptions spawn;
    spawn.command = options.resolver->Resolve(cfg.command);
    spawn.args = cfg.args;
    spawn.env = cfg.env;
    spawn.cwd = cfg.cwd;
    spawn.label = name;
    LOG_INFO("Connecting to \"{}\" ({})", name, spawn.command);

    auto instance = std::make_shared<ServerInstance>(name, executor, ChildProcess::Spawn(executor, spawn));
    attempt->instance = instance;
    instance->Start();

    std::vector<Tool> tools;
    std::exception_ptr failure;
    try {
        if (options.spawnSettle.count() > 0) {
            attempt->settle = std::make_unique<net::steady_timer>(executor, options.spawnSettle);
            boost::system::error_code ec;
            co_await attempt->settle->async_wait(net::redirect_error(net::use_awaitable, ec));
        }
        throwIfCancelled();
        if (!instance->IsProcessAlive()) {
            auto status = instance->Process().GetExitStatus();
            std::string tail = instance->Process().StderrTail(ExitedImmediatelyStderrChars);
            throw ToolBridgeError(errors::isOccupiedError(tail) ? ErrorKind::ServerOccupied : ErrorKind::SpawnFailure,
                                  fmt::format("Process exited immediately with code {}. {}",
                                              status.has_value() ? status->code : -1, tail));
        }
        HandshakeOptions handshake{options.protocolVersion, options.clientInfo, options.handshakeTimeout};
        auto handshakeOp = CoHandshake(instance, std::move(handshake));
        tools = co_await std::move(handshakeOp);
        throwIfCancelled();
    } catch (...) {
        failure = std::current_exception();
    }
    attempt->settle.reset();
    attempt->instance.reset();
    if (failure) {
        co_await instance->AsyncShutdown(options.terminateGrace);
        std::rethrow_exception(failure);
    }

    instance->SetTools(tools);
    instance->SetConnected(true);
    servers[name] = instance;
    LOG_INFO("Connected to \"{}\" ({} tools)", name, tools.size());
    co_return tools;
}

net::awaitable<ToolCallResult> ToolClient::Impl::coCallTool(std::string name, std::string toolName,
                                                            JSONValue arguments) {
    FUNC_SCOPE();
    std::shared_ptr<ServerInstance> instance = usableInstance(name);
    if (!instance) {
        LOG_INFO("Server \"{}\" is not connected; attempting reconnect", name);
        std::optional<std::string> reconnectError;
        try {
            auto reconnect = coConnect(name);
            (void)co_await std::move(reconnect);
        } catch (const std::exception& e) {
            reconnectError = e.what();
        }
        if (reconnectError.has_value()) {
            co_return ToolCallResult::Error(
                fmt::format("Failed to reconnect to \"{}\": {}", name, reconnectError.value()));
        }
        instance = usableInstance(name);
        if (!instance) {
            co_return ToolCallResult::Error(
                fmt::format("Failed to reconnect to \"{}\": connection lost after handshake", name));
        }
    }
    auto invoke = CoInvokeTool(instance, std::move(toolName), std::move(arguments), options.callTimeout);
    co_return co_await std::move(invoke);
}

// Marks an in-flight connect cancelled and stops its pre-publication work: the settle wait ends and
// the pending handshake request is rejected with TransportClosed. Returns the child to terminate, if any.
std::shared_ptr<ServerInstance> ToolClient::Impl::cancelAttempt(ConnectAttempt& attempt, const std::string& name) {
    attempt.cancelled = true;
    if (attempt.settle) {
        attempt.settle->cancel();
    }
    auto instance = attempt.instance;
    if (instance) {
        instance->Close(fmt::format("Connection to \"{}\" cancelled by disconnect", name));
    }
    return instance;
}

// Terminates the cancelled attempt's child, then waits for the attempt itself to settle.
net::awaitable<void> ToolClient::Impl::awaitCancelledAttempt(std::string name, std::shared_ptr<ConnectAttempt> attempt,
                                                             std::shared_ptr<ServerInstance> instance) {
    if (instance) {
        co_await instance->AsyncShutdown(options.terminateGrace);
    }
    if (attempt->finished) {
        co_return;
    }
    try {
        auto join = asyncJoinAttempt(attempt, net::use_awaitable);
        (void)co_await std::move(join);
    } catch (const std::exception& e) {
        LOG_DEBUG("Cancelled connect for \"{}\" settled: {}", name, e.what());
    }
}

net::awaitable<void> ToolClient::Impl::coDisconnect(std::string name) {
    if (auto inflight = attempts.find(name); inflight != attempts.end()) {
        auto attempt = inflight->second;
        auto pendingInstance = cancelAttempt(*attempt, name);
        auto settle = awaitCancelledAttempt(name, attempt, pendingInstance);
        co_await std::move(settle);
    }
    auto it = servers.find(name);
    if (it == servers.end()) {
        co_return;
    }
    auto instance = it->second;
    servers.erase(it);
    co_await instance->AsyncShutdown(options.terminateGrace);
    LOG_INFO("Disconnected from \"{}\"", name);
}

net::awaitable<void> ToolClient::Impl::coDisconnectAll() {
    std::vector<std::pair<std::string, std::shared_ptr<ConnectAttempt>>> inflight(attempts.begin(), attempts.end());
    std::vector<std::shared_ptr<ServerInstance>> pendingInstances;
    for (auto& [name, attempt] : inflight) {
        pendingInstances.push_back(cancelAttempt(*attempt, name));
    }
    auto instances = std::move(servers);
    servers.clear();
    // Settle every pending request before any process wait
    for (auto& [name, instance] : instances) {
        instance->Close(fmt::format("Server \"{}\" disconnected", name));
    }
    for (std::size_t i = 0; i < inflight.size(); ++i) {
        auto settle = awaitCancelledAttempt(inflight[i].first, inflight[i].second, pendingInstances[i]);
        co_await std::move(settle);
    }
    for (auto& [name, instance] : instances) {
        co_await instance->AsyncShutdown(options.terminateGrace);
        LOG_DEBUG("Disconnected from \"{}\"", name);
    }
    // Rejections are posted; let them run before returning
    auto executor = ioc.get_executor();
    co_await net::post(executor, net::use_awaitable);
    if (!instances.empty() || !inflight.empty()) {
        LOG_INFO("Disconnected {} server(s), cancelled {} connect(s)", instances.size(), inflight.size());
    }
}

void ToolClient::Impl::shutdownNow() {
    for (auto& [name, attempt] : attempts) {
        if (auto pendingInstance = cancelAttempt(*attempt, name)) {
            pendingInstance->ShutdownNow(options.terminateGrace);
        }
    }
    for (auto& [name, instance] : servers) {
        (void)name;
        instance->ShutdownNow(options.terminateGrace);
    }
    servers.clear();
}

////////////////////////////////////////// ToolClient ///////////////////////////////////////////

ToolClient::ToolClient(ToolBridgeConfig config, ToolClientOptions options)
    : pImpl(std::make_unique<Impl>(std::make_unique<net::io_context>(), nullptr, std::move(config),
                                   std::move(options))) {}

ToolClient::ToolClient(net::io_context& ioc, ToolBridgeConfig config, ToolClientOptions options)
    : pImpl(std::make_unique<Impl>(nullptr, &ioc, std::move(config), std::move(options))) {}

ToolClient::~ToolClient() = default;

net::io_context& ToolClient::GetIoContext() {
    return pImpl->ioc;
}

std::vector<std::string> ToolClient::ListServers() const {
    std::vector<std::string> names;
    names.reserve(pImpl->config.size());
    for (const auto& [name, cfg] : pImpl->config) {
        (void)cfg;
        names.push_back(name);
    }
    return names;
}

net::awaitable<std::vector<Tool>> ToolClient::CoConnect(std::string name) {
    return pImpl->coConnect(std::move(name));
}

std::vector<Tool> ToolClient::Connect(const std::string& name) {
    return async::RunBlocking(pImpl->ioc, pImpl->coConnect(name));
}

net::awaitable<void> ToolClient::CoDisconnect(std::string name) {
    return pImpl->coDisconnect(std::move(name));
}

void ToolClient::Disconnect(const std::string& name) {
    async::RunBlocking(pImpl->ioc, pImpl->coDisconnect(name));
}

net::awaitable<void> ToolClient::CoDisconnectAll() {
    return pImpl->coDisconnectAll();
}

void ToolClient::DisconnectAll() {
    async::RunBlocking(pImpl->ioc, pImpl->coDisconnectAll());
}

net::awaitable<ToolCallResult> ToolClient::CoCallTool(std::string name, std::string toolName, JSONValue arguments) {
    return pImpl->coCallTool(std::move(name), std::move(toolName), std::move(arguments));
}

ToolCallResult ToolClient::CallTool(const std::string& name, const std::string& toolName, const JSONValue& arguments) {
    return async::RunBlocking(pImpl->ioc, pImpl->coCallTool(name, toolName, arguments));
}

std::vector<std::string> ToolClient::GetConnectedServers() const {
    std::vector<std::string> names;
    for (const auto& [name, instance] : pImpl->servers) {
        (void)instance;
        if (pImpl->usableInstance(name)) names.push_back(name);
    }
    return names;
}

std::map<std::string, std::vector<Tool>> ToolClient::GetAllTools() const {
    std::map<std::string, std::vector<Tool>> out;
    for (const auto& [name, instance] : pImpl->servers) {
        (void)instance;
        if (auto live = pImpl->usableInstance(name)) out.emplace(name, live->Tools());
    }
    return out;
}

std::size_t ToolClient::GetTotalToolCount() const {
    std::size_t total = 0;
    for (const auto& [name, tools] : GetAllTools()) {
        (void)name;
        total += tools.size();
    }
    return total;
}

bool ToolClient::IsServerConnected(const std::string& name) const {
    return pImpl->usableInstance(name) != nullptr;
}

std::optional<std::string> ToolClient::GetServerError(const std::string& name) const {
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) return std::nullopt;
    return it->second->LastError();
}

ServerState ToolClient::GetServerState(const std::string& name) const {
    if (pImpl->attempts.count(name) != 0) return ServerState::Connecting;
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) return ServerState::Absent;
    return pImpl->usableInstance(name) ? ServerState::Connected : ServerState::Disconnected;
}

std::vector<ServerStatus> ToolClient::GetServerStatuses() const {
    std::vector<ServerStatus> out;
    for (const auto& name : ListServers()) {
        ServerStatus status;
        status.name = name;
        auto it = pImpl->servers.find(name);
        if (it != pImpl->servers.end()) {
            status.connected = pImpl->usableInstance(name) != nullptr;
            status.toolCount = it->second->Tools().size();
            status.error = it->second->LastError();
        }
        out.push_back(std::move(status));
    }
    return out;
}

std::size_t ToolClient::GetPendingRequestCount(const std::string& name) const {
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) return 0;
    return it->second->PendingCount();
}

////////////////////////////////////////// ScopedDisconnect ///////////////////////////////////////////

ScopedDisconnect::~ScopedDisconnect() {
    try {
        client.DisconnectAll();
    } catch (const std::exception& e) {
        LOG_ERROR("DisconnectAll during scope exit failed: {}", e.what());
    }
}

} // namespace toolbridge

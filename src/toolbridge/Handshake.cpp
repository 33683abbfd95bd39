//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handshake.cpp
// Purpose: Connection handshake against a spawned tool server
//==========================================================================================================

#include <utility>
#include <boost/asio/this_coro.hpp>

#include <fmt/format.h>

#include "toolbridge/Handshake.h"
#include "toolbridge/errors/ErrorClassifier.h"
#include "toolbridge/errors/Errors.h"
#include "logging/Logger.h"

namespace toolbridge {

namespace {
// Awaits one handshake request, turning its deadline into HandshakeTimeout.
net::awaitable<JSONValue> handshakeStep(std::shared_ptr<ServerInstance> instance, const char* method,
                                        std::optional<JSONValue> params, std::chrono::milliseconds timeout) {
    try {
        auto request = instance->Request(method, std::move(params), timeout);
        co_return co_await std::move(request);
    } catch (const errors::ToolBridgeError& e) {
        if (e.kind() == errors::ErrorKind::RemoteRpcError && errors::isOccupiedError(e.what())) {
            throw errors::ToolBridgeError(errors::ErrorKind::ServerOccupied, e.what(), e.rpcError());
        }
        if (e.kind() != errors::ErrorKind::RequestTimeout) {
            throw;
        }
    }
    throw errors::ToolBridgeError(errors::ErrorKind::HandshakeTimeout,
                                  fmt::format("Handshake with \"{}\" timed out during {} ({}ms)",
                                              instance->Name(), method, timeout.count()));
}
} // namespace

net::awaitable<std::vector<Tool>> CoHandshake(std::shared_ptr<ServerInstance> instance, HandshakeOptions options) {
    FUNC_SCOPE();
    LOG_DEBUG("[{}] Initializing (protocol {})", instance->Name(), options.protocolVersion);
    std::optional<JSONValue> initParams = BuildInitializeParams(options.protocolVersion, options.clientInfo);
    auto initialize = handshakeStep(instance, Methods::Initialize, std::move(initParams), options.stepTimeout);
    JSONValue initResult = co_await std::move(initialize);

    if (const JSONValue* info = initResult.Find("serverInfo")) {
        LOG_DEBUG("[{}] serverInfo: {}", instance->Name(), SerializeJSON(*info));
    }

    instance->Notify(Methods::Initialized);

    auto listTools = handshakeStep(instance, Methods::ListTools, std::nullopt, options.stepTimeout);
    JSONValue listResult = co_await std::move(listTools);
    co_return ParseToolsList(listResult);
}

} // namespace toolbridge

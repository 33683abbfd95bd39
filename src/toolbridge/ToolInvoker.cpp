//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.cpp
// Purpose: tools/call request issue and result normalization
//==========================================================================================================

#include <fmt/format.h>

#include "toolbridge/ToolInvoker.h"
#include "toolbridge/errors/Errors.h"
#include "logging/Logger.h"

namespace toolbridge {

net::awaitable<ToolCallResult> CoInvokeTool(std::shared_ptr<ServerInstance> instance, std::string toolName,
                                            JSONValue arguments, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    LOG_DEBUG("[{}] Calling tool: {}", instance->Name(), toolName);
    std::optional<std::string> failure;
    try {
        std::optional<JSONValue> params = BuildCallToolParams(toolName, arguments);
        auto call = instance->Request(Methods::CallTool, std::move(params), timeout);
        JSONValue result = co_await std::move(call);
        ToolCallResult mapped = ParseToolCallResult(result);
        if (mapped.isError) {
            LOG_DEBUG("[{}] Tool {} reported an error result", instance->Name(), toolName);
        }
        co_return mapped;
    } catch (const errors::ToolBridgeError& e) {
        failure = e.what();
        if (const auto& rpc = e.rpcError()) {
            LOG_DEBUG("[{}] tools/call error code {} ({})", instance->Name(), rpc->code,
                      errors::errorCategoryToString(rpc->category));
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }
    LOG_WARN("[{}] Tool call {} failed: {}", instance->Name(), toolName, failure.value());
    instance->MarkFailed(failure.value());
    co_return ToolCallResult::Error(fmt::format("Tool call failed: {}", failure.value()));
}

} // namespace toolbridge

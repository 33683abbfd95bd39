//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: tools/call against a connected instance with failure normalization
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "toolbridge/Protocol.h"
#include "toolbridge/ServerInstance.h"

namespace toolbridge {

//==========================================================================================================
// CoInvokeTool
// Purpose: Calls a tool and maps the reply into ToolCallResult.
// Args:
//   instance: Connected instance.
//   toolName: Tool to invoke.
//   arguments: Arguments object.
//   timeout: Call deadline.
// Returns:
//   The mapped result (isError as reported by the server). On timeout, transport failure, crash or a
//   JSON-RPC error object the instance is marked disconnected with lastError set and the result is
//   isError=true with "Tool call failed: <reason>". Never throws.
//==========================================================================================================
net::awaitable<ToolCallResult> CoInvokeTool(std::shared_ptr<ServerInstance> instance, std::string toolName,
                                            JSONValue arguments, std::chrono::milliseconds timeout);

} // namespace toolbridge

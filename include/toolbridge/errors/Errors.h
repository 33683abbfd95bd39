//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, the client failure taxonomy, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "toolbridge/JSONRPCTypes.h"

namespace toolbridge {
namespace errors {

// Categorization of JSON-RPC error codes reported by a server.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed representation of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Failure taxonomy of the tool client.
enum class ErrorKind {
    ConfigAbsent,      // server name not present in configuration
    SpawnFailure,      // executable missing, not executable, or exited during settle
    HandshakeTimeout,  // initialize or tools/list deadline exceeded
    ProtocolNoise,     // non-JSON or malformed line; logged, never thrown
    RequestTimeout,    // per-request deadline exceeded
    ServerOccupied,    // another client holds the server
    ProcessCrash,      // child exited or closed its output
    RemoteToolError,   // tools/call result carried isError
    TransportClosed,   // instance torn down while the request was pending
    RemoteRpcError     // server answered with a JSON-RPC error object
};

const char* errorKindToString(ErrorKind kind);

//==========================================================================================================
// ToolBridgeError
// Purpose: Exception thrown by connect paths and used to reject pending requests.
// Fields:
//   kind(): taxonomy entry.
//   what(): human-readable message (unclassified; see ErrorClassifier for user-facing text).
//   rpcError(): the server's JSON-RPC error object, set only for RemoteRpcError.
//==========================================================================================================
class ToolBridgeError : public std::runtime_error {
public:
    ToolBridgeError(ErrorKind kind, const std::string& message, std::optional<McpError> rpcError = std::nullopt)
        : std::runtime_error(message), kind_(kind), rpcError_(std::move(rpcError)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::optional<McpError>& rpcError() const noexcept { return rpcError_; }

private:
    ErrorKind kind_;
    std::optional<McpError> rpcError_;
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

inline const char* errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return "parse error";
        case ErrorCategory::JsonRpcInvalidRequest: return "invalid request";
        case ErrorCategory::JsonRpcMethodNotFound: return "method not found";
        case ErrorCategory::JsonRpcInvalidParams: return "invalid params";
        case ErrorCategory::JsonRpcInternal: return "internal error";
        default: return "server error";
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.Find("code");
    const JSONValue* msgVal = errVal.Find("message");
    if (codeVal == nullptr || msgVal == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) ||
        !std::holds_alternative<std::string>(msgVal->value)) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeVal->value));
    e.message = std::get<std::string>(msgVal->value);
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Build the exception used to reject a request whose response carried an error object.
inline ToolBridgeError toolBridgeErrorFromErrorValue(const JSONValue& errVal) {
    auto e = mcpErrorFromErrorValue(errVal);
    if (!e.has_value()) {
        return ToolBridgeError(ErrorKind::RemoteRpcError, "Malformed error response: " + SerializeJSON(errVal));
    }
    std::string message = e->message;
    return ToolBridgeError(ErrorKind::RemoteRpcError, message, std::move(e));
}

} // namespace errors
} // namespace toolbridge

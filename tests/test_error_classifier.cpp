//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_error_classifier.cpp
// Purpose: GoogleTests for failure classification, user-facing text and JSON-RPC error mapping
//==========================================================================================================

#include <gtest/gtest.h>

#include "toolbridge/JSONRPCTypes.h"
#include "toolbridge/errors/ErrorClassifier.h"
#include "toolbridge/errors/Errors.h"

using namespace toolbridge;
using errors::ErrorClass;

TEST(ErrorClassifier, Occupied) {
    EXPECT_EQ(errors::classifyError("Server already connected"), ErrorClass::Occupied);
    EXPECT_EQ(errors::classifyError("Port 3000 in use"), ErrorClass::Occupied);
    EXPECT_EQ(errors::classifyError("listen EADDRINUSE: address already in use"), ErrorClass::Occupied);
    EXPECT_TRUE(errors::isOccupiedError("Error: ADDRESS ALREADY IN USE"));
}

TEST(ErrorClassifier, NotFound) {
    EXPECT_EQ(errors::classifyError("Failed to spawn 'nope': No such file or directory (ENOENT)"),
              ErrorClass::NotFound);
    EXPECT_EQ(errors::classifyError("Server \"x\" not found in config"), ErrorClass::NotFound);
    EXPECT_FALSE(errors::isOccupiedError("command not found"));
}

TEST(ErrorClassifier, Timeout) {
    EXPECT_EQ(errors::classifyError("Request tools/call timed out after 60000ms"), ErrorClass::Timeout);
    EXPECT_EQ(errors::classifyError("Handshake TIMEOUT"), ErrorClass::Timeout);
}

TEST(ErrorClassifier, GenericAndFromException) {
    EXPECT_EQ(errors::classifyError("something else broke"), ErrorClass::Generic);
    EXPECT_EQ(errors::classifyError(std::runtime_error("spawn ENOENT")), ErrorClass::NotFound);
    EXPECT_STREQ(errors::errorClassToString(ErrorClass::Occupied), "occupied");
    EXPECT_STREQ(errors::errorClassToString(ErrorClass::NotFound), "not_found");
    EXPECT_STREQ(errors::errorClassToString(ErrorClass::Timeout), "timeout");
    EXPECT_STREQ(errors::errorClassToString(ErrorClass::Generic), "generic");
}

TEST(ErrorClassifier, FormatError) {
    EXPECT_EQ(errors::formatError("EADDRINUSE"),
              "Server is occupied by another client (e.g., Cursor, Claude Desktop). Close the other client first.");
    EXPECT_EQ(errors::formatError("spawn npx ENOENT"),
              "Command not found. Ensure the MCP server package is installed.");
    EXPECT_EQ(errors::formatError("operation timed out"),
              "Connection timed out. The server may be unresponsive.");
    EXPECT_EQ(errors::formatError("disk full"), "disk full");
}

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorValueMapping) {
    JSONValue err = CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "missing text",
                                      JSONValue{std::string("detail")});
    auto mapped = errors::mcpErrorFromErrorValue(err);
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(mapped->message, "missing text");
    EXPECT_EQ(mapped->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(mapped->data.has_value());

    errors::ToolBridgeError e = errors::toolBridgeErrorFromErrorValue(err);
    EXPECT_EQ(e.kind(), errors::ErrorKind::RemoteRpcError);
    EXPECT_STREQ(e.what(), "missing text");
    ASSERT_TRUE(e.rpcError().has_value());
    EXPECT_EQ(e.rpcError()->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(e.rpcError()->category, errors::ErrorCategory::JsonRpcInvalidParams);
    EXPECT_STREQ(errors::errorCategoryToString(e.rpcError()->category), "invalid params");

    JSONValue malformed{JSONValue::Object{{"message", std::make_shared<JSONValue>("no code")}}};
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(malformed).has_value());
    errors::ToolBridgeError fallback = errors::toolBridgeErrorFromErrorValue(malformed);
    EXPECT_EQ(fallback.kind(), errors::ErrorKind::RemoteRpcError);
    EXPECT_FALSE(fallback.rpcError().has_value());
}

TEST(Errors, KindNames) {
    EXPECT_STREQ(errors::errorKindToString(errors::ErrorKind::SpawnFailure), "SpawnFailure");
    EXPECT_STREQ(errors::errorKindToString(errors::ErrorKind::ServerOccupied), "ServerOccupied");
    EXPECT_STREQ(errors::errorKindToString(errors::ErrorKind::RequestTimeout), "RequestTimeout");
}

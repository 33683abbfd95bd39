//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool protocol data structures, method names, and result normalization helpers
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace toolbridge {
//==========================================================================================================
// Tool protocol types and constants
// Purpose: Shared protocol structures and method names used over the stdio channel.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version announced in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool advertised by a server through tools/list
struct Tool {
    std::string name;
    std::optional<std::string> description;
    JSONValue inputSchema;  // JSON Schema for tool parameters, kept opaque

    Tool() = default;
    Tool(std::string name, std::optional<std::string> description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Content ///////////////////////////////////////////
enum class ContentType {
    Text,
    Image,
    Resource,
    Unknown
};

// One element of a tools/call result, mapped by its declared "type" tag
struct ContentItem {
    ContentType type{ContentType::Text};
    std::string typeTag{"text"};
    std::optional<std::string> text;
    std::optional<std::string> data;
    std::optional<std::string> mimeType;
    std::optional<JSONValue> resource;

    static ContentItem MakeText(std::string t) {
        ContentItem item;
        item.text = std::move(t);
        return item;
    }
};

struct ToolCallResult {
    std::vector<ContentItem> content;
    bool isError = false;

    static ToolCallResult Error(std::string message) {
        ToolCallResult r;
        r.content.push_back(ContentItem::MakeText(std::move(message)));
        r.isError = true;
        return r;
    }
};

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Helpers ///////////////////////////////////////////
//==========================================================================================================
// BuildInitializeParams
// Purpose: Builds { protocolVersion, capabilities: {}, clientInfo: {name, version} }.
//==========================================================================================================
JSONValue BuildInitializeParams(const std::string& protocolVersion, const Implementation& clientInfo);

//==========================================================================================================
// BuildCallToolParams
// Purpose: Builds { name, arguments }.
//==========================================================================================================
JSONValue BuildCallToolParams(const std::string& toolName, const JSONValue& arguments);

//==========================================================================================================
// ParseToolsList
// Purpose: Extracts tools from a tools/list result ({ "tools": [ ... ] }).
// Args:
//   result: The "result" member of the tools/list response.
// Returns:
//   Tools in server order; entries without a string name are skipped.
//==========================================================================================================
std::vector<Tool> ParseToolsList(const JSONValue& result);

//==========================================================================================================
// ParseToolCallResult
// Purpose: Maps a tools/call result into ToolCallResult, tagging each content item by its "type".
//==========================================================================================================
ToolCallResult ParseToolCallResult(const JSONValue& result);

//==========================================================================================================
// ContentTypeFromTag / ContentTypeToString
// Purpose: Conversions between the wire "type" tag and ContentType.
//==========================================================================================================
ContentType ContentTypeFromTag(const std::string& tag);
const char* ContentTypeToString(ContentType type);

//==========================================================================================================
// CollectText
// Purpose: Concatenates the text items of a result, one per line.
//==========================================================================================================
std::string CollectText(const ToolCallResult& result);

} // namespace toolbridge

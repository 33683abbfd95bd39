//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Builders and parsers for initialize, tools/list and tools/call payloads
//==========================================================================================================

#include "toolbridge/Protocol.h"
#include "logging/Logger.h"

namespace toolbridge {

namespace {
std::optional<std::string> stringMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (v == nullptr || !std::holds_alternative<std::string>(v->value)) return std::nullopt;
    return std::get<std::string>(v->value);
}
} // namespace

JSONValue BuildInitializeParams(const std::string& protocolVersion, const Implementation& clientInfo) {
    JSONValue::Object paramsObj;
    paramsObj["protocolVersion"] = std::make_shared<JSONValue>(protocolVersion);
    paramsObj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    JSONValue::Object ci;
    ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
    ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
    paramsObj["clientInfo"] = std::make_shared<JSONValue>(std::move(ci));
    return JSONValue{std::move(paramsObj)};
}

JSONValue BuildCallToolParams(const std::string& toolName, const JSONValue& arguments) {
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(toolName);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments);
    return JSONValue{std::move(paramsObj)};
}

std::vector<Tool> ParseToolsList(const JSONValue& result) {
    std::vector<Tool> tools;
    const JSONValue* arr = result.Find("tools");
    if (arr == nullptr || !std::holds_alternative<JSONValue::Array>(arr->value)) {
        LOG_WARN("tools/list result has no tools array");
        return tools;
    }
    for (const auto& toolJson : std::get<JSONValue::Array>(arr->value)) {
        if (!toolJson || !toolJson->IsObject()) continue;
        auto name = stringMember(*toolJson, "name");
        if (!name.has_value()) {
            LOG_DEBUG("Skipping tool entry without a name");
            continue;
        }
        Tool tool;
        tool.name = std::move(name.value());
        tool.description = stringMember(*toolJson, "description");
        const JSONValue* schema = toolJson->Find("inputSchema");
        if (schema != nullptr && !std::holds_alternative<std::nullptr_t>(schema->value)) {
            tool.inputSchema = *schema;
        } else {
            tool.inputSchema = JSONValue{JSONValue::Object{}};
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

ContentType ContentTypeFromTag(const std::string& tag) {
    if (tag == "text") return ContentType::Text;
    if (tag == "image") return ContentType::Image;
    if (tag == "resource") return ContentType::Resource;
    return ContentType::Unknown;
}

const char* ContentTypeToString(ContentType type) {
    switch (type) {
        case ContentType::Text: return "text";
        case ContentType::Image: return "image";
        case ContentType::Resource: return "resource";
        default: return "unknown";
    }
}

ToolCallResult ParseToolCallResult(const JSONValue& result) {
    ToolCallResult out;
    if (const JSONValue* isErr = result.Find("isError")) {
        out.isError = std::holds_alternative<bool>(isErr->value) && std::get<bool>(isErr->value);
    }
    const JSONValue* arr = result.Find("content");
    if (arr == nullptr || !std::holds_alternative<JSONValue::Array>(arr->value)) {
        return out;
    }
    for (const auto& itemJson : std::get<JSONValue::Array>(arr->value)) {
        if (!itemJson || !itemJson->IsObject()) continue;
        ContentItem item;
        item.typeTag = stringMember(*itemJson, "type").value_or("text");
        item.type = ContentTypeFromTag(item.typeTag);
        item.text = stringMember(*itemJson, "text");
        item.data = stringMember(*itemJson, "data");
        item.mimeType = stringMember(*itemJson, "mimeType");
        if (const JSONValue* res = itemJson->Find("resource")) item.resource = *res;
        out.content.push_back(std::move(item));
    }
    return out;
}

std::string CollectText(const ToolCallResult& result) {
    std::string out;
    for (const auto& item : result.content) {
        if (item.type != ContentType::Text || !item.text.has_value()) continue;
        if (!out.empty()) out.push_back('\n');
        out += item.text.value();
    }
    return out;
}

} // namespace toolbridge

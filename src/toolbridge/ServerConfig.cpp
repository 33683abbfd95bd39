//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Config document parsing and PATH-based command resolution
//==========================================================================================================

#include <unistd.h>
#include <sys/stat.h>

#include <fstream>
#include <sstream>

#include "toolbridge/ServerConfig.h"
#include "toolbridge/JSONRPCTypes.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace toolbridge {

namespace {
std::optional<ServerConfig> parseServerEntry(const std::string& name, const JSONValue& entry) {
    const JSONValue* cmd = entry.Find("command");
    if (cmd == nullptr || !std::holds_alternative<std::string>(cmd->value)) {
        LOG_WARN("Config entry '{}' has no string 'command'; skipping", name);
        return std::nullopt;
    }
    ServerConfig cfg;
    cfg.command = std::get<std::string>(cmd->value);

    if (const JSONValue* args = entry.Find("args")) {
        if (!std::holds_alternative<JSONValue::Array>(args->value)) {
            LOG_WARN("Config entry '{}': 'args' must be an array; skipping", name);
            return std::nullopt;
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !std::holds_alternative<std::string>(a->value)) {
                LOG_WARN("Config entry '{}': non-string argument; skipping", name);
                return std::nullopt;
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = entry.Find("env")) {
        if (!env->IsObject()) {
            LOG_WARN("Config entry '{}': 'env' must be an object; skipping", name);
            return std::nullopt;
        }
        for (const auto& [key, val] : std::get<JSONValue::Object>(env->value)) {
            if (!val || !std::holds_alternative<std::string>(val->value)) {
                LOG_WARN("Config entry '{}': env '{}' is not a string; skipping", name, key);
                return std::nullopt;
            }
            cfg.env[key] = std::get<std::string>(val->value);
        }
    }

    if (const JSONValue* cwd = entry.Find("cwd")) {
        if (std::holds_alternative<std::string>(cwd->value)) {
            cfg.cwd = std::get<std::string>(cwd->value);
        } else if (!std::holds_alternative<std::nullptr_t>(cwd->value)) {
            LOG_WARN("Config entry '{}': 'cwd' must be a string; skipping", name);
            return std::nullopt;
        }
    }
    return cfg;
}
} // namespace

ToolBridgeConfig LoadConfigFromString(const std::string& json) {
    ToolBridgeConfig config;
    JSONValue doc;
    try {
        doc = ParseJSON(json);
    } catch (const std::exception& e) {
        LOG_WARN("Failed to parse tool server config: {}", e.what());
        return config;
    }
    const JSONValue* servers = doc.Find("mcpServers");
    if (servers == nullptr) {
        return config;
    }
    if (!servers->IsObject()) {
        LOG_WARN("'mcpServers' must be an object");
        return config;
    }
    for (const auto& [name, entry] : std::get<JSONValue::Object>(servers->value)) {
        if (!entry || !entry->IsObject()) {
            LOG_WARN("Config entry '{}' is not an object; skipping", name);
            continue;
        }
        auto cfg = parseServerEntry(name, *entry);
        if (cfg.has_value()) {
            config.emplace(name, std::move(cfg.value()));
        }
    }
    return config;
}

ToolBridgeConfig LoadConfigFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_DEBUG("No tool server config at {}", path);
        return ToolBridgeConfig{};
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return LoadConfigFromString(oss.str());
}

std::string DefaultConfigPath() {
    std::string explicitPath = GetEnvOrDefault("TOOLBRIDGE_CONFIG", "");
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    return GetEnvOrDefault("HOME", ".") + "/.toolbridge/mcp_config.json";
}

std::optional<std::string> FindExecutableOnPath(const std::string& name, const std::string& searchPath) {
    std::size_t start = 0;
    while (start <= searchPath.size()) {
        std::size_t end = searchPath.find(':', start);
        if (end == std::string::npos) end = searchPath.size();
        std::string dir = searchPath.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

PackageRunnerResolver::PackageRunnerResolver(std::optional<std::string> searchPath) {
    const std::string path = searchPath.has_value() ? searchPath.value() : GetEnvOrDefault("PATH", "");
    bunxAvailable = FindExecutableOnPath("bunx", path).has_value();
    LOG_DEBUG("PackageRunnerResolver: bunx {}", bunxAvailable ? "available" : "not found");
}

std::string PackageRunnerResolver::Resolve(const std::string& command) const {
    if (command == "npx" && bunxAvailable) {
        return "bunx";
    }
    return command;
}

} // namespace toolbridge

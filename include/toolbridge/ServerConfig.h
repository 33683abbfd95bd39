//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Tool server launch configuration ({"mcpServers": {...}}) and command resolution strategies
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

//==========================================================================================================
// ServerConfig
// Purpose: Immutable launch description for one named server.
//==========================================================================================================
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
};

// Server name -> launch description (ordered by name)
using ToolBridgeConfig = std::map<std::string, ServerConfig>;

//==========================================================================================================
// LoadConfigFromString
// Purpose: Parses a config document.
// Args:
//   json: Document of shape { "mcpServers": { "<name>": { command, args?, env?, cwd? } } }.
// Returns:
//   Parsed servers. Malformed documents yield an empty config and malformed entries are skipped,
//   both with a warning.
//==========================================================================================================
ToolBridgeConfig LoadConfigFromString(const std::string& json);

//==========================================================================================================
// LoadConfigFromFile
// Purpose: Reads and parses a config file; a missing file yields an empty config.
//==========================================================================================================
ToolBridgeConfig LoadConfigFromFile(const std::string& path);

// $TOOLBRIDGE_CONFIG, else $HOME/.toolbridge/mcp_config.json
std::string DefaultConfigPath();

//==========================================================================================================
// ICommandResolver
// Purpose: Strategy that rewrites a configured command before spawn.
//==========================================================================================================
class ICommandResolver {
public:
    virtual ~ICommandResolver() = default;
    virtual std::string Resolve(const std::string& command) const = 0;
};

// Leaves commands unchanged.
class DirectCommandResolver : public ICommandResolver {
public:
    std::string Resolve(const std::string& command) const override { return command; }
};

//==========================================================================================================
// PackageRunnerResolver
// Purpose: Prefers "bunx" over "npx" when bunx is an executable on PATH.
// Args (ctor):
//   searchPath: PATH-style list to search; defaults to $PATH when unset.
//==========================================================================================================
class PackageRunnerResolver : public ICommandResolver {
public:
    explicit PackageRunnerResolver(std::optional<std::string> searchPath = std::nullopt);
    std::string Resolve(const std::string& command) const override;

private:
    bool bunxAvailable;
};

// First executable named `name` in the ':'-separated directory list.
std::optional<std::string> FindExecutableOnPath(const std::string& name, const std::string& searchPath);

} // namespace toolbridge

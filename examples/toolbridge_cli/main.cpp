//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolbridge command-line driver: connect configured tool servers, list tools, call one tool
//==========================================================================================================

#include "logging/Logger.h"
#include "toolbridge/ServerConfig.h"
#include "toolbridge/ToolClient.h"
#include "toolbridge/errors/ErrorClassifier.h"
#include "toolbridge/version.h"

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace toolbridge;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cout << "toolbridge " << getVersionString() << "\n"
              << "Usage: toolbridge_cli [--config=PATH] [--server=NAME] [--list]\n"
              << "                      [--tool=NAME --args=JSON]\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help")) {
        printUsage();
        return 0;
    }

    const std::string configPath = getArgValue(argc, argv, "--config").value_or(DefaultConfigPath());
    ToolBridgeConfig config = LoadConfigFromFile(configPath);
    if (config.empty()) {
        std::cerr << "No tool servers configured in " << configPath << "\n";
        return 1;
    }

    const std::optional<std::string> selected = getArgValue(argc, argv, "--server");
    if (selected.has_value() && config.count(selected.value()) == 0) {
        std::cerr << "Server \"" << selected.value() << "\" not found in " << configPath << "\n";
        return 1;
    }

    net::io_context ioc;
    ToolClient client(ioc, config);

    // Ctrl-C tears everything down; in-flight connects and calls settle as failures
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    bool interrupted = false;
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) {
            return;
        }
        LOG_WARN("Received signal {}; disconnecting", sig);
        interrupted = true;
        net::co_spawn(ioc, client.CoDisconnectAll(), net::detached);
    });
    ScopedDisconnect guard(client);

    std::vector<std::string> targets;
    if (selected.has_value()) {
        targets.push_back(selected.value());
    } else {
        targets = client.ListServers();
    }

    for (const auto& name : targets) {
        if (interrupted) break;
        try {
            auto tools = client.Connect(name);
            std::cout << "[ok]   " << name << ": " << tools.size() << " tool(s)\n";
        } catch (const std::exception& e) {
            LOG_DEBUG("Connect {} failed: {}", name, e.what());
            std::cout << "[fail] " << name << " (" << errors::errorClassToString(errors::classifyError(e))
                      << "): " << errors::formatError(e.what()) << "\n";
        }
    }

    if (hasFlag(argc, argv, "--list")) {
        for (const auto& [server, tools] : client.GetAllTools()) {
            std::cout << "\n" << server << ":\n";
            for (const auto& t : tools) {
                std::cout << "  " << t.name;
                if (t.description.has_value()) {
                    std::cout << " - " << t.description.value();
                }
                std::cout << "\n";
            }
        }
    }

    int rc = client.GetConnectedServers().empty() ? 1 : 0;

    if (auto toolName = getArgValue(argc, argv, "--tool"); toolName.has_value() && !interrupted) {
        if (!selected.has_value() && targets.size() != 1) {
            std::cerr << "--tool requires --server when more than one server is configured\n";
            signals.cancel();
            return 2;
        }
        JSONValue arguments{JSONValue::Object{}};
        const std::string rawArgs = getArgValue(argc, argv, "--args").value_or("{}");
        try {
            arguments = ParseJSON(rawArgs);
        } catch (const std::exception& e) {
            std::cerr << "Invalid --args JSON: " << e.what() << "\n";
            signals.cancel();
            return 2;
        }
        ToolCallResult result = client.CallTool(targets.front(), toolName.value(), arguments);
        for (const auto& item : result.content) {
            if (item.type == ContentType::Text && item.text.has_value()) {
                std::cout << item.text.value() << "\n";
            } else {
                std::cout << "[" << item.typeTag << " content]\n";
            }
        }
        if (result.isError) {
            std::cerr << errors::formatError(CollectText(result)) << "\n";
            rc = 1;
        }
    }

    signals.cancel();
    return interrupted ? 130 : rc;
}

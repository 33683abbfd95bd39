//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_client.cpp
// Purpose: End-to-end ToolClient behavior against the scriptable fake tool server
//==========================================================================================================

#include <gtest/gtest.h>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include "toolbridge/ToolClient.h"
#include "toolbridge/errors/ErrorClassifier.h"
#include "toolbridge/errors/Errors.h"

#ifndef TOOLBRIDGE_FAKE_SERVER_PATH
#error "TOOLBRIDGE_FAKE_SERVER_PATH must point at the fake_tool_server executable"
#endif

using namespace toolbridge;
using namespace std::chrono_literals;

namespace {

ServerConfig fakeServer(std::vector<std::string> args = {}) {
    ServerConfig c;
    c.command = TOOLBRIDGE_FAKE_SERVER_PATH;
    c.args = std::move(args);
    return c;
}

ToolClientOptions fastOptions() {
    ToolClientOptions o;
    o.handshakeTimeout = 3s;
    o.callTimeout = 3s;
    o.spawnSettle = 50ms;
    o.terminateGrace = 500ms;
    o.resolver = std::make_shared<DirectCommandResolver>();
    return o;
}

JSONValue textArgs(const std::string& text) {
    JSONValue::Object o;
    o["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{o};
}

// Counts resolutions (one per spawn); optionally breaks every spawn after the first.
class CountingResolver : public ICommandResolver {
public:
    explicit CountingResolver(bool failAfterFirst = false) : failAfterFirst(failAfterFirst) {}
    std::string Resolve(const std::string& command) const override {
        ++calls;
        if (failAfterFirst && calls > 1) return "/nonexistent/toolbridge-fake-server";
        return command;
    }
    mutable int calls{0};

private:
    bool failAfterFirst;
};

template <typename Pred>
bool runUntil(net::io_context& ioc, Pred done, std::chrono::milliseconds limit = 10s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        if (ioc.stopped()) ioc.restart();
        ioc.run_one_for(50ms);
    }
    return true;
}

std::string makeTempDir() {
    char tmpl[] = "/tmp/toolbridge_client_XXXXXX";
    const char* dir = ::mkdtemp(tmpl);
    return dir ? std::string(dir) : std::string("/tmp");
}

// Returns 0 until the server has written a complete line
pid_t readPid(const std::string& path) {
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (content.empty() || content.back() != '\n') return 0;
    return static_cast<pid_t>(std::stol(content));
}

bool processGone(pid_t pid) {
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

// Outcome of a background CoConnect
struct ConnectOutcome {
    bool done{false};
    std::optional<errors::ErrorKind> kind;
};

void spawnConnect(ToolClient& client, const std::string& name, ConnectOutcome& outcome) {
    net::co_spawn(client.GetIoContext(), client.CoConnect(name),
                  [&outcome](std::exception_ptr e, std::vector<Tool>) {
                      outcome.done = true;
                      if (!e) return;
                      try {
                          std::rethrow_exception(e);
                      } catch (const errors::ToolBridgeError& err) {
                          outcome.kind = err.kind();
                      } catch (const std::exception&) {
                      }
                  });
}

} // namespace

TEST(ToolClient, EchoScenario) {
    ToolClient client({{"echo", fakeServer()}}, fastOptions());
    auto tools = client.Connect("echo");
    ASSERT_FALSE(tools.empty());
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_TRUE(client.IsServerConnected("echo"));
    EXPECT_EQ(client.GetServerState("echo"), ServerState::Connected);
    EXPECT_EQ(client.GetTotalToolCount(), tools.size());

    ToolCallResult r = client.CallTool("echo", "echo", textArgs("hi"));
    EXPECT_FALSE(r.isError);
    ASSERT_EQ(r.content.size(), 1u);
    EXPECT_EQ(r.content[0].type, ContentType::Text);
    EXPECT_EQ(r.content[0].text.value(), "hi");

    // Second connect returns the cached tools without respawning
    auto again = client.Connect("echo");
    EXPECT_EQ(again.size(), tools.size());
    client.DisconnectAll();
    EXPECT_TRUE(client.GetConnectedServers().empty());
}

TEST(ToolClient, BannerNoiseOnStdoutIsTolerated) {
    ToolClient client({{"noisy", fakeServer({"--banner"})}}, fastOptions());
    ASSERT_NO_THROW(client.Connect("noisy"));
    ToolCallResult r = client.CallTool("noisy", "echo", textArgs("through the noise"));
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(CollectText(r), "through the noise");
}

TEST(ToolClient, UnknownServerIsConfigAbsent) {
    ToolClient client({{"echo", fakeServer()}}, fastOptions());
    try {
        client.Connect("nope");
        FAIL() << "expected ConfigAbsent";
    } catch (const errors::ToolBridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ConfigAbsent);
        EXPECT_STREQ(e.what(), "Server \"nope\" not found in config");
    }
    ToolCallResult r = client.CallTool("nope", "echo", textArgs("x"));
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(CollectText(r), "Failed to reconnect to \"nope\": Server \"nope\" not found in config");
}

TEST(ToolClient, MissingBinaryIsSpawnFailureAndLeavesNoEntry) {
    ServerConfig missing;
    missing.command = "/nonexistent/bin/toolbridge-tool";
    ToolClient client({{"ghost", missing}}, fastOptions());
    try {
        client.Connect("ghost");
        FAIL() << "expected SpawnFailure";
    } catch (const errors::ToolBridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::SpawnFailure);
        EXPECT_EQ(errors::classifyError(e), errors::ErrorClass::NotFound);
        EXPECT_EQ(errors::formatError(e.what()), "Command not found. Ensure the MCP server package is installed.");
    }
    auto names = client.ListServers();
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "ghost");
    EXPECT_EQ(client.GetServerState("ghost"), ServerState::Absent);
    EXPECT_FALSE(client.GetServerError("ghost").has_value());
    EXPECT_TRUE(client.GetConnectedServers().empty());
}

TEST(ToolClient, ProcessExitingDuringSettleFailsConnect) {
    ToolClientOptions opts = fastOptions();
    opts.spawnSettle = 300ms;
    ToolClient client({{"dies", fakeServer({"--exit-immediately"})}}, opts);
    try {
        client.Connect("dies");
        FAIL() << "expected SpawnFailure";
    } catch (const errors::ToolBridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::SpawnFailure);
        std::string msg = e.what();
        EXPECT_NE(msg.find("Process exited immediately with code 2"), std::string::npos) << msg;
        EXPECT_NE(msg.find("fatal: cannot start"), std::string::npos) << msg;
    }
    EXPECT_EQ(client.GetServerState("dies"), ServerState::Absent);
}

TEST(ToolClient, OccupiedStderrDuringSettleIsServerOccupied) {
    ToolClientOptions opts = fastOptions();
    opts.spawnSettle = 300ms;
    ToolClient client({{"taken", fakeServer({"--occupied-exit"})}}, opts);
    try {
        client.Connect("taken");
        FAIL() << "expected ServerOccupied";
    } catch (const errors::ToolBridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerOccupied);
        std::string msg = e.what();
        EXPECT_NE(msg.find("Process exited immediately with code 1"), std::string::npos) << msg;
        EXPECT_NE(msg.find("EADDRINUSE"), std::string::npos) << msg;
        EXPECT_EQ(errors::classifyError(e), errors::ErrorClass::Occupied);
    }
    EXPECT_EQ(client.GetServerState("taken"), ServerState::Absent);
}

TEST(ToolClient, OccupiedRpcErrorDuringHandshakeIsServerOccupied) {
    ToolClient client({{"busy", fakeServer({"--occupied-rpc"})}}, fastOptions());
    try {
        client.Connect("busy");
        FAIL() << "expected ServerOccupied";
    } catch (const errors::ToolBridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerOccupied);
        EXPECT_STREQ(e.what(), "already connected");
        ASSERT_TRUE(e.rpcError().has_value());
        EXPECT_EQ(e.rpcError()->code, -32000);
        EXPECT_EQ(errors::formatError(e.what()),
                  "Server is occupied by another client (e.g., Cursor, Claude Desktop). Close the other client first.");
    }
    EXPECT_EQ(client.GetServerState("busy"), ServerState::Absent);
}

TEST(ToolClient, HandshakeTimeoutKillsAndDiscardsInstance) {
    ToolClientOptions opts = fastOptions();
    opts.handshakeTimeout = 200ms;
    ToolClient client({{"mute", fakeServer({"--no-handshake"})}}, opts);
    auto start = std::chrono::steady_clock::now();
    try {
        client.Connect("mute");
        FAIL() << "expected HandshakeTimeout";
    } catch (const errors::ToolBridgeError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::HandshakeTimeout);
        EXPECT_NE(std::string(e.what()).find("initialize"), std::string::npos);
        EXPECT_EQ(errors::classifyError(e), errors::ErrorClass::Timeout);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, 200ms);
    EXPECT_EQ(client.GetServerState("mute"), ServerState::Absent);
}

TEST(ToolClient, CallTimeoutIsNeverEarlyAndMarksDisconnected) {
    ToolClientOptions opts = fastOptions();
    opts.callTimeout = 250ms;
    ToolClient client({{"deaf", fakeServer({"--ignore-calls"})}}, opts);
    client.Connect("deaf");

    auto start = std::chrono::steady_clock::now();
    ToolCallResult r = client.CallTool("deaf", "echo", textArgs("anyone?"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 250ms);
    EXPECT_TRUE(r.isError);
    std::string text = CollectText(r);
    EXPECT_EQ(text.rfind("Tool call failed: ", 0), 0u) << text;
    EXPECT_NE(text.find("timed out"), std::string::npos) << text;
    EXPECT_FALSE(client.IsServerConnected("deaf"));
    EXPECT_EQ(client.GetServerState("deaf"), ServerState::Disconnected);
    ASSERT_TRUE(client.GetServerError("deaf").has_value());
    EXPECT_EQ(client.GetPendingRequestCount("deaf"), 0u);
}

TEST(ToolClient, ResponsesInScrambledOrderReachTheirCallers) {
    ToolClient client({{"rev", fakeServer({"--reverse-batch=3"})}}, fastOptions());
    client.Connect("rev");
    auto& ioc = client.GetIoContext();

    std::vector<std::optional<ToolCallResult>> results(3);
    for (std::size_t i = 0; i < results.size(); ++i) {
        net::co_spawn(
            ioc,
            [&client, &results, i]() -> net::awaitable<void> {
                auto call = client.CoCallTool("rev", "echo", textArgs("msg-" + std::to_string(i)));
                results[i] = co_await std::move(call);
            },
            net::detached);
    }
    ASSERT_TRUE(runUntil(ioc, [&] {
        for (const auto& r : results) {
            if (!r.has_value()) return false;
        }
        return true;
    }));
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_FALSE(results[i]->isError);
        EXPECT_EQ(CollectText(results[i].value()), "msg-" + std::to_string(i));
    }
}

TEST(ToolClient, DisconnectAllSettlesPendingAndDisarmsTimers) {
    ToolClientOptions opts = fastOptions();
    opts.callTimeout = 30s;
    ToolClient client({{"a", fakeServer({"--ignore-calls"})}, {"b", fakeServer({"--ignore-calls"})}}, opts);
    client.Connect("a");
    client.Connect("b");
    auto& ioc = client.GetIoContext();

    std::vector<std::optional<ToolCallResult>> results(2);
    const char* names[] = {"a", "b"};
    for (std::size_t i = 0; i < results.size(); ++i) {
        net::co_spawn(
            ioc,
            [&client, &results, i, name = std::string(names[i])]() -> net::awaitable<void> {
                auto call = client.CoCallTool(name, "echo", textArgs("pending"));
                results[i] = co_await std::move(call);
            },
            net::detached);
    }
    ASSERT_TRUE(runUntil(ioc, [&] {
        return client.GetPendingRequestCount("a") == 1 && client.GetPendingRequestCount("b") == 1;
    }));

    auto start = std::chrono::steady_clock::now();
    client.DisconnectAll();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(client.GetConnectedServers().empty());
    EXPECT_EQ(client.GetServerState("a"), ServerState::Absent);

    ASSERT_TRUE(runUntil(ioc, [&] { return results[0].has_value() && results[1].has_value(); }, 2s));
    for (const auto& r : results) {
        EXPECT_TRUE(r->isError);
        EXPECT_EQ(CollectText(r.value()).rfind("Tool call failed: ", 0), 0u);
    }

    // Nothing left armed: the loop runs out of work well before the 30s call deadline
    ioc.restart();
    ioc.run_for(2s);
    EXPECT_TRUE(ioc.stopped());
}

TEST(ToolClient, DisconnectAllCancelsInFlightHandshake) {
    const std::string dir = makeTempDir();
    const std::string pidFile = dir + "/server.pid";
    ToolClientOptions opts = fastOptions();
    opts.handshakeTimeout = 20s;
    ToolClient client({{"mute", fakeServer({"--no-handshake", "--pid-file=" + pidFile})}}, opts);
    auto& ioc = client.GetIoContext();

    ConnectOutcome outcome;
    spawnConnect(client, "mute", outcome);
    const auto begin = std::chrono::steady_clock::now();
    // Past the settle window, with initialize outstanding
    ASSERT_TRUE(runUntil(ioc, [&] { return std::chrono::steady_clock::now() - begin >= 300ms; }));
    ASSERT_FALSE(outcome.done);
    EXPECT_EQ(client.GetServerState("mute"), ServerState::Connecting);
    const pid_t pid = readPid(pidFile);
    ASSERT_GT(pid, 0);

    auto start = std::chrono::steady_clock::now();
    client.DisconnectAll();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_TRUE(outcome.done);
    ASSERT_TRUE(outcome.kind.has_value());
    EXPECT_EQ(outcome.kind.value(), errors::ErrorKind::TransportClosed);
    EXPECT_EQ(client.GetServerState("mute"), ServerState::Absent);
    EXPECT_TRUE(processGone(pid));

    // No handshake deadline is left armed
    ioc.restart();
    ioc.run_for(2s);
    EXPECT_TRUE(ioc.stopped());

    ::unlink(pidFile.c_str());
    ::rmdir(dir.c_str());
}

TEST(ToolClient, DisconnectDuringSettleEndsTheWait) {
    const std::string dir = makeTempDir();
    const std::string pidFile = dir + "/server.pid";
    ToolClientOptions opts = fastOptions();
    opts.spawnSettle = 30s;
    ToolClient client({{"slow", fakeServer({"--pid-file=" + pidFile})}}, opts);
    auto& ioc = client.GetIoContext();

    ConnectOutcome outcome;
    spawnConnect(client, "slow", outcome);
    ASSERT_TRUE(runUntil(ioc, [&] { return readPid(pidFile) > 0; }));
    const pid_t pid = readPid(pidFile);

    auto start = std::chrono::steady_clock::now();
    client.Disconnect("slow");
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
    EXPECT_TRUE(outcome.done);
    ASSERT_TRUE(outcome.kind.has_value());
    EXPECT_EQ(outcome.kind.value(), errors::ErrorKind::TransportClosed);
    EXPECT_EQ(client.GetServerState("slow"), ServerState::Absent);
    EXPECT_TRUE(processGone(pid));

    ::unlink(pidFile.c_str());
    ::rmdir(dir.c_str());
}

TEST(ToolClient, CrashRecordsStderrAndReconnectsExactlyOnce) {
    auto resolver = std::make_shared<CountingResolver>();
    ToolClientOptions opts = fastOptions();
    opts.resolver = resolver;
    ToolClient client({{"crashy", fakeServer({"--crash-on-call"})}}, opts);
    client.Connect("crashy");
    EXPECT_EQ(resolver->calls, 1);

    ToolCallResult first = client.CallTool("crashy", "echo", textArgs("x"));
    EXPECT_TRUE(first.isError);
    EXPECT_FALSE(client.IsServerConnected("crashy"));
    auto err = client.GetServerError("crashy");
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->find("boom"), std::string::npos) << err.value();

    // One reconnect, which succeeds, then the call crashes the new process too
    ToolCallResult second = client.CallTool("crashy", "echo", textArgs("x"));
    EXPECT_TRUE(second.isError);
    EXPECT_EQ(resolver->calls, 2);
}

TEST(ToolClient, CrashThenReconnectRecovers) {
    const std::string dir = makeTempDir();
    const std::string marker = dir + "/crashed";
    ToolClient client({{"flaky", fakeServer({"--crash-once=" + marker})}}, fastOptions());
    client.Connect("flaky");

    ToolCallResult crashed = client.CallTool("flaky", "echo", textArgs("first"));
    EXPECT_TRUE(crashed.isError);
    EXPECT_EQ(client.GetServerState("flaky"), ServerState::Disconnected);

    ToolCallResult recovered = client.CallTool("flaky", "echo", textArgs("second"));
    EXPECT_FALSE(recovered.isError) << CollectText(recovered);
    EXPECT_EQ(CollectText(recovered), "second");
    EXPECT_TRUE(client.IsServerConnected("flaky"));

    client.DisconnectAll();
    ::unlink(marker.c_str());
    ::rmdir(dir.c_str());
}

TEST(ToolClient, FailedReconnectIsReportedNotThrown) {
    auto resolver = std::make_shared<CountingResolver>(true);
    ToolClientOptions opts = fastOptions();
    opts.resolver = resolver;
    ToolClient client({{"once", fakeServer({"--crash-on-call"})}}, opts);
    client.Connect("once");
    (void)client.CallTool("once", "echo", textArgs("x"));

    ToolCallResult r = client.CallTool("once", "echo", textArgs("x"));
    EXPECT_TRUE(r.isError);
    std::string text = CollectText(r);
    EXPECT_EQ(text.rfind("Failed to reconnect to \"once\": ", 0), 0u) << text;
    EXPECT_NE(text.find("ENOENT"), std::string::npos) << text;
    EXPECT_EQ(resolver->calls, 2);
    EXPECT_EQ(client.GetServerState("once"), ServerState::Absent);
}

TEST(ToolClient, ConcurrentConnectsShareOneAttempt) {
    auto resolver = std::make_shared<CountingResolver>();
    ToolClientOptions opts = fastOptions();
    opts.resolver = resolver;
    ToolClient client({{"shared", fakeServer()}}, opts);
    auto& ioc = client.GetIoContext();

    std::vector<std::optional<std::size_t>> toolCounts(3);
    for (std::size_t i = 0; i < toolCounts.size(); ++i) {
        net::co_spawn(
            ioc,
            [&client, &toolCounts, i]() -> net::awaitable<void> {
                auto connect = client.CoConnect("shared");
                auto tools = co_await std::move(connect);
                toolCounts[i] = tools.size();
            },
            net::detached);
    }
    ASSERT_TRUE(runUntil(ioc, [&] {
        for (const auto& c : toolCounts) {
            if (!c.has_value()) return false;
        }
        return true;
    }));
    EXPECT_EQ(resolver->calls, 1);
    for (const auto& c : toolCounts) {
        EXPECT_EQ(c.value(), toolCounts[0].value());
        EXPECT_GT(c.value(), 0u);
    }
}

TEST(ToolClient, ToolErrorResultKeepsConnection) {
    ToolClient client({{"srv", fakeServer()}}, fastOptions());
    client.Connect("srv");
    ToolCallResult r = client.CallTool("srv", "fail", JSONValue{JSONValue::Object{}});
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(CollectText(r), "tool failed on purpose");
    EXPECT_TRUE(client.IsServerConnected("srv"));
}

TEST(ToolClient, JsonRpcErrorReplyIsReportedAsFailure) {
    ToolClient client({{"srv", fakeServer()}}, fastOptions());
    client.Connect("srv");
    ToolCallResult r = client.CallTool("srv", "no_such_tool", JSONValue{JSONValue::Object{}});
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(CollectText(r), "Tool call failed: Unknown tool: no_such_tool");
    EXPECT_FALSE(client.IsServerConnected("srv"));

    // The next call reconnects transparently
    ToolCallResult ok = client.CallTool("srv", "echo", textArgs("back"));
    EXPECT_FALSE(ok.isError);
    EXPECT_EQ(CollectText(ok), "back");
}

TEST(ToolClient, ConfigEnvironmentReachesServer) {
    ServerConfig cfg = fakeServer();
    cfg.env["TOOLBRIDGE_FAKE_GREETING"] = "hello from config";
    ToolClient client({{"env", cfg}}, fastOptions());
    client.Connect("env");
    JSONValue::Object args;
    args["name"] = std::make_shared<JSONValue>("TOOLBRIDGE_FAKE_GREETING");
    ToolCallResult r = client.CallTool("env", "getenv", JSONValue{args});
    EXPECT_EQ(CollectText(r), "hello from config");
}

TEST(ToolClient, DisconnectRemovesOneServer) {
    ToolClient client({{"a", fakeServer()}, {"b", fakeServer()}}, fastOptions());
    client.Connect("a");
    client.Connect("b");
    ASSERT_EQ(client.GetConnectedServers().size(), 2u);

    client.Disconnect("a");
    EXPECT_EQ(client.GetServerState("a"), ServerState::Absent);
    EXPECT_TRUE(client.IsServerConnected("b"));
    auto all = client.GetAllTools();
    EXPECT_EQ(all.count("a"), 0u);
    EXPECT_EQ(all.count("b"), 1u);

    auto statuses = client.GetServerStatuses();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0].name, "a");
    EXPECT_FALSE(statuses[0].connected);
    EXPECT_TRUE(statuses[1].connected);
    EXPECT_GT(statuses[1].toolCount, 0u);
}

TEST(ToolClient, ScopedDisconnectTearsDownOnScopeExit) {
    ToolClient client({{"scoped", fakeServer()}}, fastOptions());
    {
        ScopedDisconnect guard(client);
        client.Connect("scoped");
        EXPECT_TRUE(client.IsServerConnected("scoped"));
    }
    EXPECT_TRUE(client.GetConnectedServers().empty());
    EXPECT_EQ(client.GetServerState("scoped"), ServerState::Absent);
}

TEST(ToolClientOptions, EnvironmentOverrides) {
    ::setenv("TOOLBRIDGE_CALL_TIMEOUT_MS", "1234", 1);
    ::setenv("TOOLBRIDGE_HANDSHAKE_TIMEOUT_MS", "not-a-number", 1);
    ::unsetenv("TOOLBRIDGE_SPAWN_SETTLE_MS");
    ToolClientOptions o = ToolClientOptions::FromEnvironment();
    EXPECT_EQ(o.callTimeout, 1234ms);
    EXPECT_EQ(o.handshakeTimeout, 10000ms);
    EXPECT_EQ(o.spawnSettle, 500ms);
    EXPECT_EQ(o.protocolVersion, "2024-11-05");
    EXPECT_EQ(o.clientInfo.name, "toolbridge");
    EXPECT_FALSE(o.clientInfo.version.empty());
    ::unsetenv("TOOLBRIDGE_CALL_TIMEOUT_MS");
    ::unsetenv("TOOLBRIDGE_HANDSHAKE_TIMEOUT_MS");
    EXPECT_STREQ(serverStateToString(ServerState::Disconnected), "disconnected");
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerInstance.cpp
// Purpose: stdio reader/dispatcher/writer coroutines and request correlation for one tool server
//==========================================================================================================

#include <array>

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>

#include "toolbridge/ServerInstance.h"
#include "toolbridge/errors/Errors.h"
#include "logging/Logger.h"

namespace toolbridge {

namespace {
constexpr std::size_t ReadChunkBytes = 8192;
constexpr std::chrono::milliseconds ExitObservationWindow{1000};
constexpr std::chrono::milliseconds StderrSettleStep{5};
constexpr int StderrSettleSteps = 50;

std::string trimTrailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
    return s;
}
} // namespace

ServerInstance::ServerInstance(std::string name, const net::any_io_executor& executor,
                               std::unique_ptr<ChildProcess> process)
    : name(std::move(name)), executor(executor), process(std::move(process)), pending(executor) {}

ServerInstance::~ServerInstance() {
    if (!closing) {
        Close(fmt::format("Server \"{}\" connection destroyed", name));
    }
}

void ServerInstance::Start() {
    net::co_spawn(executor, [self = shared_from_this()]() { return self->readStdout(); }, net::detached);
    net::co_spawn(executor, [self = shared_from_this()]() { return self->readStderr(); }, net::detached);
}

net::awaitable<void> ServerInstance::readStdout() {
    auto self = shared_from_this();
    std::array<char, ReadChunkBytes> buf{};
    auto forward = [this, &self](const std::string& line) {
        auto frame = DecodeLine(line, name);
        if (!frame.has_value()) return;
        net::post(executor, [self, f = std::move(frame.value())]() { self->dispatchFrame(f); });
    };
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await process->Stdout().async_read_some(
            net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != net::error::eof && ec != net::error::operation_aborted) {
                LOG_DEBUG("[{}] stdout read failed: {}", name, ec.message());
            }
            break;
        }
        for (const auto& line : splitter.Feed(buf.data(), n)) {
            forward(line);
        }
    }
    if (auto rest = splitter.Flush()) {
        forward(rest.value());
    }
    if (closing) {
        co_return;
    }
    // Let frames already queued for the dispatcher settle their requests first
    co_await net::post(executor, net::use_awaitable);
    co_await onOutputClosed();
}

net::awaitable<void> ServerInstance::readStderr() {
    auto self = shared_from_this();
    std::array<char, ReadChunkBytes> buf{};
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await process->Stderr().async_read_some(
            net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }
        process->AppendStderr(buf.data(), n);
        LOG_DEBUG("[{} stderr] {}", name, trimTrailing(std::string(buf.data(), n)));
    }
    stderrClosed = true;
}

net::awaitable<void> ServerInstance::onOutputClosed() {
    connected = false;
    auto status = co_await process->AsyncWaitExit(ExitObservationWindow);

    // The final stderr chunk may still be in flight
    net::steady_timer timer(executor);
    for (int i = 0; i < StderrSettleSteps && !stderrClosed && !closing; ++i) {
        timer.expires_after(StderrSettleStep);
        co_await timer.async_wait(net::use_awaitable);
    }
    if (closing) {
        co_return;
    }

    std::string message;
    if (status.has_value()) {
        message = fmt::format("Server \"{}\" {}", name, status->Describe());
        if (status->code != 0) {
            std::string tail = trimTrailing(process->StderrTail(LastErrorStderrChars));
            lastError = tail.empty() ? message : tail;
            if (!tail.empty()) {
                message += ": " + tail;
            }
            LOG_WARN("{}", message);
        } else {
            LOG_INFO("{}", message);
        }
    } else {
        message = fmt::format("Server \"{}\" closed its output", name);
        lastError = message;
        LOG_WARN("{}", message);
    }
    pending.RejectAll(std::make_exception_ptr(errors::ToolBridgeError(errors::ErrorKind::ProcessCrash, message)));
}

void ServerInstance::dispatchFrame(const JSONValue& frame) {
    const JSONValue* method = frame.Find("method");
    if (method != nullptr) {
        if (frame.Find("id") != nullptr) {
            JSONRPCRequest req;
            if (req.FromJSON(frame)) {
                LOG_DEBUG("[{}] Rejecting server-initiated request '{}'", name, req.method);
                auto resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound,
                                                "Method not found: " + req.method);
                enqueueWrite(EncodeFrame(*resp));
            }
            return;
        }
        LOG_DEBUG("[{}] Notification: {}", name, SerializeJSON(*method));
        return;
    }

    JSONRPCResponse resp;
    if (!resp.FromJSON(frame) || !std::holds_alternative<int64_t>(resp.id)) {
        LOG_DEBUG("[{}] Ignoring frame without a usable id", name);
        return;
    }
    const int64_t id = std::get<int64_t>(resp.id);
    bool matched = false;
    if (resp.IsError()) {
        matched = pending.Reject(id, std::make_exception_ptr(errors::toolBridgeErrorFromErrorValue(resp.error.value())));
    } else {
        matched = pending.Resolve(id, resp.result.value());
    }
    if (!matched) {
        LOG_DEBUG("[{}] Discarding response for unknown or expired id {}", name, id);
    }
}

net::awaitable<JSONValue> ServerInstance::Request(std::string method, std::optional<JSONValue> params,
                                                  std::chrono::milliseconds timeout) {
    if (closing) {
        throw errors::ToolBridgeError(errors::ErrorKind::TransportClosed,
                                      fmt::format("Server \"{}\" connection is closed", name));
    }
    const int64_t id = nextRequestId++;
    JSONRPCRequest request(JSONRPCId{id}, method, std::move(params));
    std::string frame = EncodeFrame(request);
    LOG_DEBUG("[{}] -> {} (id={})", name, method, id);
    auto self = shared_from_this();
    std::string label = method;
    auto writeFrame = [self, frame = std::move(frame)]() mutable { self->enqueueWrite(std::move(frame)); };
    auto response = AsyncAwaitResponse(pending, id, timeout, std::move(label), std::move(writeFrame),
                                       net::use_awaitable);
    JSONValue result = co_await std::move(response);
    co_return result;
}

void ServerInstance::Notify(const std::string& method, std::optional<JSONValue> params) {
    JSONRPCNotification note(method, std::move(params));
    LOG_DEBUG("[{}] -> {} (notification)", name, method);
    enqueueWrite(EncodeFrame(note));
}

void ServerInstance::enqueueWrite(std::string frame) {
    if (closing) {
        return;
    }
    writeQueue.push_back(std::move(frame));
    if (writing) {
        return;
    }
    writing = true;
    net::co_spawn(executor, [self = shared_from_this()]() { return self->drainWrites(); }, net::detached);
}

net::awaitable<void> ServerInstance::drainWrites() {
    while (!writeQueue.empty() && !closing) {
        boost::system::error_code ec;
        co_await net::async_write(process->Stdin(), net::buffer(writeQueue.front()),
                                  net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            writing = false;
            if (!closing) {
                failTransport(fmt::format("Failed to write to server \"{}\": {}", name, ec.message()),
                              errors::ErrorKind::TransportClosed);
            }
            co_return;
        }
        writeQueue.pop_front();
    }
    writing = false;
}

void ServerInstance::failTransport(const std::string& message, errors::ErrorKind kind) {
    LOG_WARN("{}", message);
    connected = false;
    lastError = message;
    pending.RejectAll(std::make_exception_ptr(errors::ToolBridgeError(kind, message)));
}

void ServerInstance::MarkFailed(const std::string& message) {
    connected = false;
    lastError = message;
}

void ServerInstance::Close(const std::string& reason) {
    if (closing) {
        return;
    }
    closing = true;
    connected = false;
    const std::size_t rejected = pending.RejectAll(
        std::make_exception_ptr(errors::ToolBridgeError(errors::ErrorKind::TransportClosed, reason)));
    if (rejected > 0) {
        LOG_DEBUG("[{}] Rejected {} pending request(s): {}", name, rejected, reason);
    }
    process->ClosePipes();
}

net::awaitable<void> ServerInstance::AsyncShutdown(std::chrono::milliseconds grace) {
    auto self = shared_from_this();
    Close(fmt::format("Server \"{}\" disconnected", name));
    co_await process->AsyncTerminate(grace);
}

void ServerInstance::ShutdownNow(std::chrono::milliseconds grace) {
    Close(fmt::format("Server \"{}\" disconnected", name));
    process->TerminateNow(grace);
}

} // namespace toolbridge

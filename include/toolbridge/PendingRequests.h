//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequests.h
// Purpose: Correlation table mapping request ids to completions with per-request deadlines
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <fmt/format.h>

#include "toolbridge/errors/Errors.h"

namespace toolbridge {

namespace net = boost::asio;

//==========================================================================================================
// PendingRequests<T>
// Purpose: Holds one entry per outstanding request id. Each entry is removed exactly once by whichever
//          of Resolve/Reject, its deadline, or RejectAll happens first; later attempts observe the
//          missing entry and return false.
// Notes:
//   - Single-threaded: all calls and timer callbacks run on the table's executor.
//   - Callbacks are invoked after the entry is removed, so they may register new requests.
//==========================================================================================================
template <typename T>
class PendingRequests {
public:
    using ResultHandler = std::function<void(T)>;
    using ErrorHandler = std::function<void(std::exception_ptr)>;

    explicit PendingRequests(net::any_io_executor executor)
        : executor(std::move(executor)), state(std::make_shared<State>()) {}

    PendingRequests(const PendingRequests&) = delete;
    PendingRequests& operator=(const PendingRequests&) = delete;

    ~PendingRequests() {
        RejectAll(std::make_exception_ptr(
            errors::ToolBridgeError(errors::ErrorKind::TransportClosed, "Request abandoned: connection destroyed")));
    }

    //======================================================================================================
    // Register
    // Purpose: Stores a pending entry and arms its deadline timer.
    // Args:
    //   id: Request id; must not already be pending.
    //   onResult / onError: Completion pair; exactly one is invoked, at most once.
    //   timeout: Deadline relative to now. On expiry onError receives ToolBridgeError(RequestTimeout).
    //   label: Used in the timeout message (defaults to the id).
    // Returns:
    //   false when the id is already pending (nothing is stored).
    //======================================================================================================
    bool Register(int64_t id, ResultHandler onResult, ErrorHandler onError,
                  std::chrono::milliseconds timeout, const std::string& label = std::string()) {
        if (state->entries.count(id) != 0) {
            return false;
        }
        auto timer = std::make_shared<net::steady_timer>(executor, timeout);
        state->entries.emplace(id, Entry{std::move(onResult), std::move(onError), timer});

        std::weak_ptr<State> weak = state;
        std::string message = fmt::format("Request {} timed out after {}ms",
                                          label.empty() ? std::to_string(id) : label, timeout.count());
        timer->async_wait([weak, id, message = std::move(message)](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            auto s = weak.lock();
            if (!s) {
                return;
            }
            auto it = s->entries.find(id);
            if (it == s->entries.end()) {
                return;
            }
            Entry entry = std::move(it->second);
            s->entries.erase(it);
            entry.onError(std::make_exception_ptr(
                errors::ToolBridgeError(errors::ErrorKind::RequestTimeout, message)));
        });
        return true;
    }

    // Completes the entry for id with a value. Returns false when no entry exists.
    bool Resolve(int64_t id, T value) {
        auto entry = take(id);
        if (!entry) {
            return false;
        }
        entry->onResult(std::move(value));
        return true;
    }

    // Completes the entry for id with an error. Returns false when no entry exists.
    bool Reject(int64_t id, std::exception_ptr error) {
        auto entry = take(id);
        if (!entry) {
            return false;
        }
        entry->onError(std::move(error));
        return true;
    }

    // Settles every pending entry with error and cancels all deadline timers.
    std::size_t RejectAll(std::exception_ptr error) {
        std::unordered_map<int64_t, Entry> drained;
        drained.swap(state->entries);
        for (auto& [id, entry] : drained) {
            (void)id;
            entry.timer->cancel();
        }
        for (auto& [id, entry] : drained) {
            (void)id;
            entry.onError(error);
        }
        return drained.size();
    }

    bool Contains(int64_t id) const { return state->entries.count(id) != 0; }
    std::size_t Size() const { return state->entries.size(); }
    const net::any_io_executor& GetExecutor() const { return executor; }

private:
    struct Entry {
        ResultHandler onResult;
        ErrorHandler onError;
        std::shared_ptr<net::steady_timer> timer;
    };

    struct State {
        std::unordered_map<int64_t, Entry> entries;
    };

    std::unique_ptr<Entry> take(int64_t id) {
        auto it = state->entries.find(id);
        if (it == state->entries.end()) {
            return nullptr;
        }
        auto entry = std::make_unique<Entry>(std::move(it->second));
        state->entries.erase(it);
        entry->timer->cancel();
        return entry;
    }

    net::any_io_executor executor;
    std::shared_ptr<State> state;
};

//==========================================================================================================
// AsyncAwaitResponse
// Purpose: Adapts a PendingRequests registration to an asio completion token (e.g. use_awaitable).
// Args:
//   table: Correlation table; must outlive the operation.
//   id, timeout, label: Forwarded to Register.
//   afterRegister: Invoked once the entry exists (typically writes the request frame).
//   token: Completion token; signature is void(std::exception_ptr, T).
// Notes:
//   Completions are posted to the table's executor, never invoked inline from Resolve/Reject.
//==========================================================================================================
template <typename T, typename AfterRegister, typename CompletionToken>
auto AsyncAwaitResponse(PendingRequests<T>& table, int64_t id, std::chrono::milliseconds timeout,
                        std::string label, AfterRegister afterRegister, CompletionToken&& token) {
    return net::async_initiate<CompletionToken, void(std::exception_ptr, T)>(
        [&table, id, timeout, label = std::move(label), afterRegister = std::move(afterRegister)](auto handler) mutable {
            using Handler = decltype(handler);
            auto shared = std::make_shared<Handler>(std::move(handler));
            auto ex = table.GetExecutor();
            const bool registered = table.Register(
                id,
                [shared, ex](T value) {
                    net::post(ex, [shared, value = std::move(value)]() mutable { (*shared)(nullptr, std::move(value)); });
                },
                [shared, ex](std::exception_ptr err) {
                    net::post(ex, [shared, err]() { (*shared)(err, T{}); });
                },
                timeout, label);
            if (!registered) {
                auto err = std::make_exception_ptr(errors::ToolBridgeError(
                    errors::ErrorKind::TransportClosed, fmt::format("Duplicate request id {}", id)));
                net::post(ex, [shared, err]() { (*shared)(err, T{}); });
                return;
            }
            afterRegister();
        },
        token);
}

} // namespace toolbridge

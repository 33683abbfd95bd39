//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Blocking.h
// Purpose: Drive an asio awaitable to completion from synchronous code on a single-threaded io_context
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace toolbridge {
namespace async {

namespace net = boost::asio;

// RunBlocking(ioc, op) - spawns op on ioc and runs handlers one at a time until op completes.
// Other work on the same io_context (readers of other servers, timers) keeps progressing meanwhile.
// Must not be called from a handler already running on ioc.

template <typename T>
T RunBlocking(net::io_context& ioc, net::awaitable<T> op) {
    if (ioc.get_executor().running_in_this_thread()) {
        throw std::logic_error("RunBlocking called from inside the io_context; co_await the Co* variant instead");
    }
    std::optional<T> result;
    std::exception_ptr error;
    bool done = false;
    net::co_spawn(ioc, std::move(op), [&](std::exception_ptr e, T value) {
        error = e;
        if (!e) result.emplace(std::move(value));
        done = true;
    });
    while (!done) {
        if (ioc.stopped()) ioc.restart();
        ioc.run_one();
    }
    if (error) std::rethrow_exception(error);
    return std::move(result.value());
}

// void specialization

inline void RunBlocking(net::io_context& ioc, net::awaitable<void> op) {
    if (ioc.get_executor().running_in_this_thread()) {
        throw std::logic_error("RunBlocking called from inside the io_context; co_await the Co* variant instead");
    }
    std::exception_ptr error;
    bool done = false;
    net::co_spawn(ioc, std::move(op), [&](std::exception_ptr e) {
        error = e;
        done = true;
    });
    while (!done) {
        if (ioc.stopped()) ioc.restart();
        ioc.run_one();
    }
    if (error) std::rethrow_exception(error);
}

} // namespace async
} // namespace toolbridge

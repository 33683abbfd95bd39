//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handshake.h
// Purpose: initialize -> notifications/initialized -> tools/list connection sequence
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "toolbridge/Protocol.h"
#include "toolbridge/ServerInstance.h"

namespace toolbridge {

struct HandshakeOptions {
    std::string protocolVersion{PROTOCOL_VERSION};
    Implementation clientInfo;
    std::chrono::milliseconds stepTimeout{10000};
};

//==========================================================================================================
// CoHandshake
// Purpose: Runs the three handshake steps in order, each bounded by stepTimeout.
// Args:
//   instance: Freshly started instance (not yet connected).
//   options: Protocol version, client identity and per-step deadline.
// Returns:
//   Tools advertised by tools/list. The caller publishes them and flips the instance to connected.
// Throws:
//   ToolBridgeError: HandshakeTimeout when a step's deadline passes; otherwise the step's error kind.
//==========================================================================================================
net::awaitable<std::vector<Tool>> CoHandshake(std::shared_ptr<ServerInstance> instance, HandshakeOptions options);

} // namespace toolbridge

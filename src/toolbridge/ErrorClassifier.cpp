//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorClassifier.cpp
// Purpose: Substring-based failure classification and ErrorKind names
//==========================================================================================================

#include "toolbridge/errors/ErrorClassifier.h"
#include "toolbridge/errors/Errors.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace toolbridge {
namespace errors {

namespace {
std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <std::size_t N>
bool containsAny(const std::string& haystack, const std::array<const char*, N>& needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&haystack](const char* n) { return haystack.find(n) != std::string::npos; });
}

const std::array<const char*, 4> kOccupiedMarkers{"already connected", "in use", "address already in use", "eaddrinuse"};
const std::array<const char*, 2> kNotFoundMarkers{"not found", "enoent"};
const std::array<const char*, 2> kTimeoutMarkers{"timeout", "timed out"};
} // namespace

const char* errorClassToString(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::Occupied: return "occupied";
        case ErrorClass::NotFound: return "not_found";
        case ErrorClass::Timeout: return "timeout";
        default: return "generic";
    }
}

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigAbsent: return "ConfigAbsent";
        case ErrorKind::SpawnFailure: return "SpawnFailure";
        case ErrorKind::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorKind::ProtocolNoise: return "ProtocolNoise";
        case ErrorKind::RequestTimeout: return "RequestTimeout";
        case ErrorKind::ServerOccupied: return "ServerOccupied";
        case ErrorKind::ProcessCrash: return "ProcessCrash";
        case ErrorKind::RemoteToolError: return "RemoteToolError";
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::RemoteRpcError: return "RemoteRpcError";
    }
    return "Unknown";
}

ErrorClass classifyError(const std::string& message) {
    const std::string lower = toLower(message);
    if (containsAny(lower, kOccupiedMarkers)) return ErrorClass::Occupied;
    if (containsAny(lower, kNotFoundMarkers)) return ErrorClass::NotFound;
    if (containsAny(lower, kTimeoutMarkers)) return ErrorClass::Timeout;
    return ErrorClass::Generic;
}

ErrorClass classifyError(const std::exception& e) {
    return classifyError(std::string(e.what()));
}

std::string formatError(const std::string& message) {
    switch (classifyError(message)) {
        case ErrorClass::Occupied:
            return "Server is occupied by another client (e.g., Cursor, Claude Desktop). Close the other client first.";
        case ErrorClass::NotFound:
            return "Command not found. Ensure the MCP server package is installed.";
        case ErrorClass::Timeout:
            return "Connection timed out. The server may be unresponsive.";
        default:
            return message;
    }
}

bool isOccupiedError(const std::string& message) {
    return classifyError(message) == ErrorClass::Occupied;
}

} // namespace errors
} // namespace toolbridge

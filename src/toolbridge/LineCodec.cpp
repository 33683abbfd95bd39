//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineCodec.cpp
// Purpose: Line splitting and JSON frame decoding for child process output
//==========================================================================================================

#include "toolbridge/LineCodec.h"
#include "logging/Logger.h"

#include <cstring>
#include <exception>

namespace toolbridge {

namespace {
constexpr std::size_t NoisePreviewChars = 80;

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return std::string();
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
} // namespace

std::vector<std::string> LineSplitter::Feed(const char* data, std::size_t size) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < size) {
        const char* nl = static_cast<const char*>(std::memchr(data + pos, '\n', size - pos));
        std::size_t end = nl ? static_cast<std::size_t>(nl - data) : size;
        if (!discarding) {
            partial.append(data + pos, end - pos);
        }
        if (nl == nullptr) {
            if (partial.size() > maxLineBytes) {
                LOG_WARN("Dropping oversized line ({} bytes buffered, limit {})", partial.size(), maxLineBytes);
                partial.clear();
                discarding = true;
            }
            break;
        }
        if (!partial.empty() && partial.back() == '\r') partial.pop_back();
        if (discarding) {
            discarding = false;
        } else if (partial.size() > maxLineBytes) {
            LOG_WARN("Dropping oversized line ({} bytes, limit {})", partial.size(), maxLineBytes);
            partial.clear();
        } else {
            lines.push_back(std::move(partial));
            partial.clear();
        }
        pos = end + 1;
    }
    return lines;
}

std::optional<std::string> LineSplitter::Flush() {
    discarding = false;
    if (partial.empty()) return std::nullopt;
    std::string out = std::move(partial);
    partial.clear();
    if (!out.empty() && out.back() == '\r') out.pop_back();
    return out;
}

std::optional<JSONValue> DecodeLine(const std::string& line, const std::string& source) {
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (trimmed.front() != '{') {
        LOG_DEBUG("[{}] Non-JSON: {}", source, trimmed.substr(0, NoisePreviewChars));
        return std::nullopt;
    }
    try {
        JSONValue v = ParseJSON(trimmed);
        if (!v.IsObject()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception& e) {
        LOG_DEBUG("[{}] Failed to parse: {} ({})", source, trimmed.substr(0, NoisePreviewChars), e.what());
        return std::nullopt;
    }
}

std::string EncodeFrame(const JSONRPCMessage& message) {
    std::string out = message.Serialize();
    out.push_back('\n');
    return out;
}

} // namespace toolbridge

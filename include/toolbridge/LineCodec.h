//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineCodec.h
// Purpose: Newline-delimited framing for the stdio channel with tolerance for non-protocol output
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "toolbridge/JSONRPCTypes.h"

namespace toolbridge {

//==========================================================================================================
// LineSplitter
// Purpose: Accumulates raw bytes from a pipe and yields complete '\n'-terminated lines.
// Notes:
//   - A trailing '\r' is stripped from each line.
//   - A partial line longer than maxLineBytes is dropped (and the remainder of that line skipped).
//==========================================================================================================
class LineSplitter {
public:
    static constexpr std::size_t DefaultMaxLineBytes = 4 * 1024 * 1024;

    explicit LineSplitter(std::size_t maxLineBytes = DefaultMaxLineBytes) : maxLineBytes(maxLineBytes) {}

    // Appends bytes and returns every line completed by them, in order.
    std::vector<std::string> Feed(const char* data, std::size_t size);
    std::vector<std::string> Feed(const std::string& chunk) { return Feed(chunk.data(), chunk.size()); }

    // Returns the unterminated trailing line (if any) and clears it; used at EOF.
    std::optional<std::string> Flush();

    std::size_t Pending() const { return partial.size(); }

private:
    std::size_t maxLineBytes;
    std::string partial;
    bool discarding{false};
};

//==========================================================================================================
// DecodeLine
// Purpose: Turns one output line into a protocol frame.
// Args:
//   line: A single line without its terminator.
//   source: Label for debug logging (server name).
// Returns:
//   The parsed JSON object; std::nullopt for blank lines, lines not starting with '{',
//   and malformed JSON (the latter two are logged at debug level and otherwise ignored).
//==========================================================================================================
std::optional<JSONValue> DecodeLine(const std::string& line, const std::string& source = std::string());

//==========================================================================================================
// EncodeFrame
// Purpose: Serializes a message as a single '\n'-terminated line.
//==========================================================================================================
std::string EncodeFrame(const JSONRPCMessage& message);

} // namespace toolbridge

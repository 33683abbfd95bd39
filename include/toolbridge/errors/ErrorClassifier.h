//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorClassifier.h
// Purpose: Presentation-only classification of raw failure text into user-facing guidance
//==========================================================================================================

#pragma once

#include <exception>
#include <string>

namespace toolbridge {
namespace errors {

enum class ErrorClass {
    Occupied,
    NotFound,
    Timeout,
    Generic
};

const char* errorClassToString(ErrorClass cls);

//==========================================================================================================
// classifyError
// Purpose: Case-insensitive substring classification of a failure message.
// Args:
//   message: Raw error text (exception what(), lastError, etc.).
// Returns:
//   Occupied, NotFound, Timeout, or Generic (checked in that order).
//==========================================================================================================
ErrorClass classifyError(const std::string& message);

// Same as classifyError(e.what()).
ErrorClass classifyError(const std::exception& e);

//==========================================================================================================
// formatError
// Purpose: Actionable text for the class of message; Generic returns the raw message.
//==========================================================================================================
std::string formatError(const std::string& message);

// True when the message indicates another client holds the server.
bool isOccupiedError(const std::string& message);

} // namespace errors
} // namespace toolbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    return std::getenv(name) ? std::string(std::getenv(name)) : defaultValue;
}

//==========================================================================================================
// GetEnvMillis
// Purpose: Reads a non-negative millisecond count from the environment.
// Args:
//   name: Environment variable name.
// Returns:
//   Duration when set and well-formed; std::nullopt when unset, empty, or malformed.
//==========================================================================================================
inline std::optional<std::chrono::milliseconds> GetEnvMillis(const char* name) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty() || v[0] == '-') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        unsigned long long ms = std::stoull(v, &used);
        if (used != v.size()) return std::nullopt;
        return std::chrono::milliseconds(static_cast<long long>(ms));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

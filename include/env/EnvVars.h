//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely, with typed fallbacks.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <cstdint>
#include <optional>
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
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvOptional
// Purpose: Returns the value of the environment variable, or std::nullopt when unset/empty.
//==========================================================================================================
inline std::optional<std::string> GetEnvOptional(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

//==========================================================================================================
// ParseBoolFlag
// Purpose: Interprets "1/true/yes/on" and "0/false/no/off" (case-insensitive).
// Returns:
//   The parsed flag, or std::nullopt when the text is not a recognized boolean.
//==========================================================================================================
inline std::optional<bool> ParseBoolFlag(const std::string& text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

//==========================================================================================================
// ParseUnsigned
// Purpose: Parses a non-negative decimal integer without throwing.
// Returns:
//   The parsed value, or std::nullopt when the text is empty, non-numeric, or out of range.
//==========================================================================================================
inline std::optional<uint64_t> ParseUnsigned(const std::string& text) {
    if (text.empty() || text.size() > 19) return std::nullopt;
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10u + static_cast<uint64_t>(c - '0');
    }
    return v;
}

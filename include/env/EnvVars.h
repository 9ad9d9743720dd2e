//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
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
// GetEnvBool
// Purpose: Reads a boolean flag. "1", "true", "yes", "on" (any case) are true; any other set value is false.
// Returns:
//   defaultValue when the variable is unset or empty.
//==========================================================================================================
inline bool GetEnvBool(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    for (auto& c : v) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

//==========================================================================================================
// GetEnvUnsigned
// Purpose: Reads a non-negative integer.
// Returns:
//   defaultValue when unset; std::nullopt when set but not a plain decimal number.
//==========================================================================================================
inline std::optional<unsigned long> GetEnvUnsigned(const char* name, unsigned long defaultValue) {
    std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    try {
        return std::stoul(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy shared by the token manager, forwarding proxy and configuration loader
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace relay {
namespace errors {

// Categorization of relay failures.
enum class ErrorCategory {
    AuthFailure,     // OAuth fetch could not produce a token
    UpstreamError,   // upstream answered with a non-200 status
    TransportError,  // network failure or timeout talking to upstream
    ConfigError      // malformed inbound JSON or malformed startup configuration
};

// Typed error representation used across components.
struct RelayError {
    ErrorCategory category{ErrorCategory::TransportError};
    std::string message;
};

//==========================================================================================================
// ConfigError
// Purpose: Raised while loading startup configuration when a value cannot be used.
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace errors
} // namespace relay

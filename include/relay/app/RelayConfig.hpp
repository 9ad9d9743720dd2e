//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/app/RelayConfig.hpp
// Purpose: Relay configuration read once from the environment at startup
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "relay/token/TokenManager.hpp"

namespace relay::app {

//==========================================================================================================
// RelayConfig
// Purpose: Everything the relay needs to run. Environment variables and their defaults:
//   LLM_API_BASE_URL (https://api.example.com), LLM_MODEL_NAME (gpt-4-internal), MAX_TOKENS (4096),
//   OAUTH_ENDPOINT, OAUTH_CLIENT_ID, OAUTH_CLIENT_SECRET, TOKEN_REFRESH_INTERVAL (900 seconds),
//   MOCK_MODE (false), RELAY_LISTEN (http://127.0.0.1:8889), RELAY_LOG_DIR ($HOME/.oauth-relay/logs),
//   RELAY_TOKEN_ENV_VAR (CUSTOM_LLM_API_KEY), RELAY_CA_FILE, RELAY_CA_PATH,
//   RELAY_SHUTDOWN_GRACE_SECONDS (10), RELAY_MAX_BODY_BYTES (33554432).
//==========================================================================================================
struct RelayConfig {
    std::string upstreamBaseUrl{"https://api.example.com"};
    std::string modelName{"gpt-4-internal"};
    unsigned long maxTokens{4096};
    token::OAuthConfig oauth;
    std::chrono::seconds refreshInterval{900};
    std::string listenUrl{"http://127.0.0.1:8889"};
    std::string logDir;
    std::string tokenEnvVar{"CUSTOM_LLM_API_KEY"};
    std::chrono::seconds shutdownGrace{10};
    unsigned int upstreamTimeoutMs{120000};
    std::size_t maxRequestBytes{32u * 1024u * 1024u};

    //======================================================================================================
    // FromEnvironment
    // Throws:
    //   relay::errors::ConfigError when a numeric value is malformed, the refresh interval is zero, or the
    //   listen URL cannot be parsed.
    //======================================================================================================
    static RelayConfig FromEnvironment();

    // Display-safe pairs for the status document; the client secret is never included.
    std::vector<std::pair<std::string, std::string>> DisplayPairs() const;
};

} // namespace relay::app

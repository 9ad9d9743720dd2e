//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/app/RelayConfig.cpp
// Purpose: Environment-driven configuration loading
//==========================================================================================================

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "relay/app/RelayConfig.hpp"
#include "relay/errors/Errors.h"
#include "relay/http/HttpServer.hpp"

namespace relay::app {

namespace {

unsigned long requireUnsigned(const char* name, unsigned long defaultValue) {
    auto v = GetEnvUnsigned(name, defaultValue);
    if (!v.has_value()) {
        throw errors::ConfigError(fmt::format("{} must be a non-negative integer, got '{}'", name, GetEnvOrDefault(name, "")));
    }
    return *v;
}

} // namespace

RelayConfig RelayConfig::FromEnvironment() {
    RelayConfig cfg;
    cfg.upstreamBaseUrl = GetEnvOrDefault("LLM_API_BASE_URL", cfg.upstreamBaseUrl);
    cfg.modelName = GetEnvOrDefault("LLM_MODEL_NAME", cfg.modelName);
    cfg.maxTokens = requireUnsigned("MAX_TOKENS", cfg.maxTokens);

    cfg.oauth.endpoint = GetEnvOrDefault("OAUTH_ENDPOINT", "");
    cfg.oauth.clientId = GetEnvOrDefault("OAUTH_CLIENT_ID", "");
    cfg.oauth.clientSecret = GetEnvOrDefault("OAUTH_CLIENT_SECRET", "");
    cfg.oauth.mockMode = GetEnvBool("MOCK_MODE", false);
    cfg.oauth.caFile = GetEnvOrDefault("RELAY_CA_FILE", "");
    cfg.oauth.caPath = GetEnvOrDefault("RELAY_CA_PATH", "");

    const unsigned long interval = requireUnsigned("TOKEN_REFRESH_INTERVAL", static_cast<unsigned long>(cfg.refreshInterval.count()));
    if (interval == 0) {
        throw errors::ConfigError("TOKEN_REFRESH_INTERVAL must be greater than zero");
    }
    cfg.refreshInterval = std::chrono::seconds(interval);

    cfg.listenUrl = GetEnvOrDefault("RELAY_LISTEN", cfg.listenUrl);
    (void)http::HttpServer::FromListenUrl(cfg.listenUrl);

    cfg.logDir = GetEnvOrDefault("RELAY_LOG_DIR", GetEnvOrDefault("HOME", ".") + "/.oauth-relay/logs");
    cfg.tokenEnvVar = GetEnvOrDefault("RELAY_TOKEN_ENV_VAR", cfg.tokenEnvVar);
    cfg.shutdownGrace = std::chrono::seconds(requireUnsigned("RELAY_SHUTDOWN_GRACE_SECONDS", static_cast<unsigned long>(cfg.shutdownGrace.count())));
    cfg.maxRequestBytes = requireUnsigned("RELAY_MAX_BODY_BYTES", static_cast<unsigned long>(cfg.maxRequestBytes));
    if (cfg.maxRequestBytes == 0) {
        throw errors::ConfigError("RELAY_MAX_BODY_BYTES must be greater than zero");
    }

    if (!cfg.oauth.mockMode && cfg.oauth.endpoint.empty()) {
        LOG_WARN("OAUTH_ENDPOINT is not set and MOCK_MODE is off; proxied requests will fail with 401");
    }
    return cfg;
}

std::vector<std::pair<std::string, std::string>> RelayConfig::DisplayPairs() const {
    return {
        {"MOCK_MODE", oauth.mockMode ? "true" : "false"},
        {"LLM_API_BASE_URL", upstreamBaseUrl},
        {"LLM_MODEL_NAME", modelName},
        {"MAX_TOKENS", std::to_string(maxTokens)},
        {"TOKEN_REFRESH_INTERVAL", fmt::format("{}s", refreshInterval.count())},
        {"OAUTH_ENDPOINT", oauth.endpoint.empty() ? std::string("Not set") : oauth.endpoint},
        {"OAUTH_CLIENT_ID", oauth.clientId.empty() ? std::string("Not set") : oauth.clientId},
        {"RELAY_LISTEN", listenUrl},
        {"RELAY_TOKEN_ENV_VAR", tokenEnvVar},
    };
}

} // namespace relay::app

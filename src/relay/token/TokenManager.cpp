//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/token/TokenManager.cpp
// Purpose: OAuth2 client-credentials fetch, caching and background refresh
//==========================================================================================================

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "relay/JSONValue.h"
#include "relay/http/HttpClient.hpp"
#include "relay/token/TokenManager.hpp"

using namespace std::chrono;

namespace relay::token {

const std::string TokenManager::kMockToken = std::string("mock_token_for_local_development_") + std::string(50, 'x');

namespace {

constexpr std::size_t kErrorBodyPrefix = 500;

std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

TokenResult authFailure(std::string message) {
    TokenResult r;
    r.error = errors::RelayError{errors::ErrorCategory::AuthFailure, std::move(message)};
    return r;
}

} // namespace

TokenManager::TokenManager(OAuthConfig config, TokenStore& tokenStore, TokenManagerOptions options)
    : cfg(std::move(config)), store(tokenStore), opts(std::move(options)) {}

TokenManager::~TokenManager() {
    StopBackgroundRefresh();
}

TimePoint TokenManager::now() const {
    return opts.clock ? opts.clock() : system_clock::now();
}

void TokenManager::setEventSink(EventSink fn) {
    onEvent = std::move(fn);
}

void TokenManager::setTokenPublisher(TokenPublisher fn) {
    onToken = std::move(fn);
}

void TokenManager::emit(log::Severity severity, const std::string& message, const std::optional<std::string>& details) {
    if (onEvent) {
        onEvent(severity, message, details);
    }
}

TokenResult TokenManager::GetToken() {
    return acquire(false);
}

TokenResult TokenManager::ForceRefresh() {
    return acquire(true);
}

TokenResult TokenManager::acquire(bool force) {
    std::promise<TokenResult> promise;
    std::shared_future<TokenResult> waitOn;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lk(flightMtx);
        if (!force) {
            auto cached = store.Get();
            if (cached && cached->IsValidAt(now())) {
                LOG_DEBUG("TokenManager: using cached token");
                return TokenResult{std::move(cached), std::nullopt};
            }
        }
        if (inflight.valid()) {
            waitOn = inflight;
        } else {
            leader = true;
            inflight = promise.get_future().share();
        }
    }
    if (!leader) {
        return waitOn.get();
    }

    TokenResult result;
    try {
        result = fetch();
    } catch (const std::exception& e) {
        result = authFailure(std::string("Token fetch failed: ") + e.what());
    }
    {
        std::lock_guard<std::mutex> lk(flightMtx);
        if (result.ok()) {
            store.Replace(*result.credential);
        }
        inflight = std::shared_future<TokenResult>();
    }
    if (result.ok()) {
        recordSuccess(*result.credential);
    } else {
        recordFailure(result.error->message);
    }
    promise.set_value(result);
    return result;
}

TokenResult TokenManager::fetch() {
    const TimePoint startedAt = now();
    if (cfg.mockMode) {
        LOG_INFO("Mock mode: using mock OAuth token");
        Credential c{kMockToken, startedAt, startedAt + kMockLifetime};
        return TokenResult{c, std::nullopt};
    }
    return fetchRemote(startedAt);
}

TokenResult TokenManager::fetchRemote(TimePoint startedAt) {
    if (cfg.endpoint.empty()) {
        return authFailure("OAuth endpoint is not configured");
    }
    LOG_INFO("Fetching new OAuth token from {}", cfg.endpoint);

    std::ostringstream form;
    form << "grant_type=client_credentials";
    form << "&client_id=" << urlEncodeForm(cfg.clientId);
    form << "&client_secret=" << urlEncodeForm(cfg.clientSecret);

    http::HttpCallParams params;
    params.url = cfg.endpoint;
    params.contentType = "application/x-www-form-urlencoded";
    params.body = form.str();
    params.caFile = cfg.caFile;
    params.caPath = cfg.caPath;
    params.connectTimeoutMs = opts.requestTimeoutMs;
    params.readTimeoutMs = opts.requestTimeoutMs;
    params.maxResponseBytes = 1024u * 1024u;

    const auto resp = http::PostSync(params);
    if (!resp.completed) {
        if (resp.timedOut) {
            return authFailure(fmt::format("OAuth request timed out after {}ms", opts.requestTimeoutMs));
        }
        return authFailure(std::string("OAuth request failed: ") + resp.error);
    }
    if (resp.status < 200 || resp.status >= 300) {
        return authFailure(fmt::format("OAuth endpoint returned HTTP {}: {}", resp.status, resp.body.substr(0, kErrorBodyPrefix)));
    }

    std::string parseError;
    auto doc = ParseJSON(resp.body, &parseError);
    if (!doc.has_value()) {
        return authFailure(std::string("OAuth response is not valid JSON: ") + parseError);
    }
    if (!doc->isObject()) {
        return authFailure("OAuth response is not a JSON object");
    }
    auto accessToken = GetStringMember(*doc, "access_token");
    if (!accessToken.has_value() || accessToken->empty()) {
        return authFailure("No access_token in OAuth response");
    }

    std::int64_t expiresIn = GetIntMember(*doc, "expires_in").value_or(kDefaultExpiresInSeconds);
    if (expiresIn <= 0) {
        LOG_WARN("OAuth response carried non-positive expires_in={}, assuming {}s", expiresIn, kDefaultExpiresInSeconds);
        expiresIn = kDefaultExpiresInSeconds;
    }
    if (expiresIn > kMaxExpiresInSeconds) {
        LOG_WARN("OAuth response carried expires_in={}, clamping to {}s", expiresIn, kMaxExpiresInSeconds);
        expiresIn = kMaxExpiresInSeconds;
    }
    const std::string tokenType = GetStringMember(*doc, "token_type").value_or("unknown");
    LOG_INFO("Token obtained: type={}, expires_in={}s", tokenType, expiresIn);

    // Keep expiresAt strictly after obtainedAt even for very short lifetimes.
    const seconds lifetime(expiresIn);
    const seconds margin = std::min(opts.safetyMargin, seconds(expiresIn / 2));
    Credential c{*accessToken, startedAt, startedAt + lifetime - margin};
    emit(log::Severity::Success, "OAuth token obtained", fmt::format("Expires in {}s", expiresIn));
    return TokenResult{c, std::nullopt};
}

void TokenManager::recordSuccess(const Credential& credential) {
    {
        std::lock_guard<std::mutex> lk(statusMtx);
        refreshCount += 1;
        lastRefresh = now();
        oauthStatus = cfg.mockMode ? std::string("Mock mode") : std::string("Active");
        lastError.clear();
    }
    if (onToken) {
        onToken(credential.token);
    }
}

void TokenManager::recordFailure(const std::string& message) {
    LOG_ERROR("Failed to fetch OAuth token: {}", message);
    std::lock_guard<std::mutex> lk(statusMtx);
    oauthStatus = "Refresh failed";
    lastError = message;
}

TokenStatus TokenManager::Status() const {
    TokenStatus s;
    {
        std::lock_guard<std::mutex> lk(statusMtx);
        s.refreshCount = refreshCount;
        s.lastRefresh = lastRefresh;
        s.oauthStatus = oauthStatus;
        s.lastError = lastError;
    }
    if (auto c = store.Get()) {
        s.tokenValid = c->IsValidAt(now());
        s.expiresAt = c->expiresAt;
    }
    return s;
}

void TokenManager::StartBackgroundRefresh(milliseconds interval) {
    StopBackgroundRefresh();
    if (interval <= milliseconds(0)) {
        LOG_WARN("TokenManager: ignoring non-positive refresh interval");
        return;
    }
    refresher = std::jthread([this, interval](std::stop_token st) { refreshLoop(st, interval); });
    LOG_INFO("Token refresh thread started (interval: {}ms)", interval.count());
    emit(log::Severity::Info, "Token refresh enabled",
         fmt::format("Interval: {}s", duration_cast<duration<double>>(interval).count()));
}

void TokenManager::StopBackgroundRefresh() {
    if (refresher.joinable()) {
        refresher.request_stop();
        refresher.join();
        LOG_DEBUG("TokenManager: background refresh stopped");
    }
}

void TokenManager::refreshLoop(std::stop_token st, milliseconds interval) {
    while (!st.stop_requested()) {
        {
            std::unique_lock<std::mutex> lk(waitMtx);
            waitCv.wait_for(lk, st, interval, [] { return false; });
        }
        if (st.stop_requested()) {
            break;
        }
        LOG_INFO("Background token refresh triggered");
        emit(log::Severity::Info, "Refreshing OAuth token (background)");
        auto r = ForceRefresh();
        if (r.ok()) {
            LOG_INFO("OAuth token refreshed successfully");
            emit(log::Severity::Success, "OAuth token refreshed");
        } else {
            LOG_WARN("Failed to refresh OAuth token: {}", r.error->message);
            emit(log::Severity::Warning, "Failed to refresh OAuth token", r.error->message);
        }
    }
}

} // namespace relay::token

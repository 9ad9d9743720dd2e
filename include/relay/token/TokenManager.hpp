//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/token/TokenManager.hpp
// Purpose: OAuth2 client-credentials token lifecycle (single-flight fetch, mock mode, background refresh)
//==========================================================================================================
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "relay/errors/Errors.h"
#include "relay/log/RequestLogger.hpp"
#include "relay/token/ITokenSource.hpp"
#include "relay/token/TokenStore.hpp"

namespace relay::token {

//==========================================================================================================
// OAuthConfig
// Purpose: Where and how tokens are obtained. Immutable once the manager is constructed.
// Fields:
//   endpoint: Token URL (http or https).
//   clientId/clientSecret: Client-credentials pair, sent form-encoded.
//   mockMode: When true no network call is made and a fixed placeholder token is produced.
//   caFile/caPath: Optional trust anchors for an https endpoint.
//==========================================================================================================
struct OAuthConfig {
    std::string endpoint;
    std::string clientId;
    std::string clientSecret;
    bool mockMode{false};
    std::string caFile;
    std::string caPath;
};

struct TokenManagerOptions {
    std::chrono::seconds safetyMargin{60};
    unsigned int requestTimeoutMs{30000};
    std::function<TimePoint()> clock;
};

struct TokenStatus {
    std::uint64_t refreshCount{0};
    std::optional<TimePoint> lastRefresh;
    std::string oauthStatus;
    std::string lastError;
    bool tokenValid{false};
    std::optional<TimePoint> expiresAt;
};

//==========================================================================================================
// TokenManager
// Purpose: Serves valid credentials from the TokenStore and refreshes them from the OAuth endpoint.
// Notes:
//   - Concurrent callers that find no valid credential share one fetch and observe the same result.
//   - Failures never throw; they come back as TokenResult::error with category AuthFailure.
//   - setEventSink/setTokenPublisher must be called before StartBackgroundRefresh.
//==========================================================================================================
class TokenManager final : public ITokenSource {
public:
    using EventSink = std::function<void(log::Severity, const std::string&, const std::optional<std::string>&)>;
    using TokenPublisher = std::function<void(const std::string&)>;

    static const std::string kMockToken;
    static constexpr std::chrono::hours kMockLifetime{24};
    static constexpr std::int64_t kDefaultExpiresInSeconds = 3600;
    // Longer advertised lifetimes are clamped to one year.
    static constexpr std::int64_t kMaxExpiresInSeconds = 365LL * 24 * 3600;

    TokenManager(OAuthConfig config, TokenStore& store, TokenManagerOptions options = TokenManagerOptions());
    ~TokenManager() override;

    TokenManager(const TokenManager&) = delete;
    TokenManager& operator=(const TokenManager&) = delete;

    // Returns the cached credential while valid, otherwise fetches (single-flight).
    TokenResult GetToken() override;
    // Fetches through the same single-flight gate regardless of cached validity.
    TokenResult ForceRefresh();

    void StartBackgroundRefresh(std::chrono::milliseconds interval);
    void StopBackgroundRefresh();
    bool backgroundRefreshRunning() const { return refresher.joinable(); }

    void setEventSink(EventSink fn);
    void setTokenPublisher(TokenPublisher fn);

    TokenStatus Status() const;

private:
    TokenResult acquire(bool force);
    TokenResult fetch();
    TokenResult fetchRemote(TimePoint startedAt);
    void recordSuccess(const Credential& credential);
    void recordFailure(const std::string& message);
    void emit(log::Severity severity, const std::string& message, const std::optional<std::string>& details = std::nullopt);
    void refreshLoop(std::stop_token st, std::chrono::milliseconds interval);
    TimePoint now() const;

    const OAuthConfig cfg;
    TokenStore& store;
    const TokenManagerOptions opts;

    std::mutex flightMtx;
    std::shared_future<TokenResult> inflight;

    mutable std::mutex statusMtx;
    std::uint64_t refreshCount{0};
    std::optional<TimePoint> lastRefresh;
    std::string oauthStatus{"Not initialized"};
    std::string lastError;

    EventSink onEvent;
    TokenPublisher onToken;

    std::mutex waitMtx;
    std::condition_variable_any waitCv;
    std::jthread refresher;
};

} // namespace relay::token

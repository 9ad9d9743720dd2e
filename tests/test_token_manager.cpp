//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_token_manager.cpp
// Purpose: GoogleTests for OAuth token fetching, caching, single-flight and background refresh
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "relay/token/TokenManager.hpp"
#include "support/StubHttpServer.hpp"

using namespace relay;
using namespace relay::token;
using relaytest::StubHttpServer;
using relaytest::StubRequest;
using relaytest::StubResponse;

namespace {

// Manually advanced wall clock shared with the manager.
struct FakeClock {
    std::chrono::system_clock::time_point base{std::chrono::seconds(1700000000)};
    std::atomic<long long> offsetSeconds{0};

    std::function<TimePoint()> fn() {
        return [this]() { return base + std::chrono::seconds(offsetSeconds.load()); };
    }
};

OAuthConfig remoteConfig(const StubHttpServer& srv) {
    OAuthConfig c;
    c.endpoint = srv.url("/oauth/token");
    c.clientId = "relay-client";
    c.clientSecret = "s3cret&+";
    return c;
}

TokenManagerOptions fastOptions() {
    TokenManagerOptions o;
    o.requestTimeoutMs = 1500;
    return o;
}

} // namespace

TEST(TokenManager, MockModeNeverTouchesTheNetwork) {
    StubHttpServer srv([](const StubRequest&) { return StubResponse{200, "application/json", "{}"}; });
    srv.start();
    OAuthConfig cfg = remoteConfig(srv);
    cfg.mockMode = true;
    TokenStore store;
    TokenManager mgr(cfg, store);

    auto r = mgr.GetToken();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.credential->token, std::string("mock_token_for_local_development_") + std::string(50, 'x'));
    EXPECT_EQ(r.credential->expiresAt - r.credential->obtainedAt, std::chrono::hours(24));
    EXPECT_EQ(srv.hits(), 0);
    EXPECT_EQ(mgr.Status().oauthStatus, "Mock mode");
    EXPECT_TRUE(mgr.Status().tokenValid);
    srv.stop();
}

TEST(TokenManager, FetchesFormEncodedAndCaches) {
    StubHttpServer srv([](const StubRequest&) {
        return StubResponse{200, "application/json", R"({"access_token":"ABC123","expires_in":3600,"token_type":"Bearer"})"};
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    auto first = mgr.GetToken();
    ASSERT_TRUE(first.ok()) << first.error->message;
    EXPECT_EQ(first.credential->token, "ABC123");
    auto second = mgr.GetToken();
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(srv.hits("/oauth/token"), 1);

    auto reqs = srv.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].contentType, "application/x-www-form-urlencoded");
    EXPECT_EQ(reqs[0].body, "grant_type=client_credentials&client_id=relay-client&client_secret=s3cret%26%2B");

    auto st = mgr.Status();
    EXPECT_EQ(st.refreshCount, 1u);
    EXPECT_EQ(st.oauthStatus, "Active");
    EXPECT_TRUE(st.lastRefresh.has_value());
    ASSERT_TRUE(store.Get().has_value());
    EXPECT_EQ(store.Get()->token, "ABC123");
    srv.stop();
}

TEST(TokenManager, ExpiryAppliesSafetyMarginAndDefaultLifetime) {
    StubHttpServer srv([](const StubRequest&) {
        return StubResponse{200, "application/json", R"({"access_token":"T"})"};
    });
    srv.start();
    FakeClock clock;
    TokenManagerOptions opts = fastOptions();
    opts.clock = clock.fn();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, opts);

    auto r = mgr.GetToken();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.credential->obtainedAt, clock.base);
    EXPECT_EQ(r.credential->expiresAt, clock.base + std::chrono::seconds(3600 - 60));
    srv.stop();
}

TEST(TokenManager, ExpiredCredentialIsNeverReturned) {
    std::atomic<int> served{0};
    StubHttpServer srv([&served](const StubRequest&) {
        int n = ++served;
        return StubResponse{200, "application/json", "{\"access_token\":\"tok" + std::to_string(n) + "\",\"expires_in\":120}"};
    });
    srv.start();
    FakeClock clock;
    TokenManagerOptions opts = fastOptions();
    opts.clock = clock.fn();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, opts);

    auto a = mgr.GetToken();
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.credential->token, "tok1");

    clock.offsetSeconds.store(59);
    auto b = mgr.GetToken();
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(b.credential->token, "tok1");
    EXPECT_EQ(srv.hits(), 1);

    clock.offsetSeconds.store(61);
    auto c = mgr.GetToken();
    ASSERT_TRUE(c.ok());
    EXPECT_EQ(c.credential->token, "tok2");
    EXPECT_TRUE(c.credential->IsValidAt(clock.base + std::chrono::seconds(61)));
    EXPECT_EQ(srv.hits(), 2);
    srv.stop();
}

TEST(TokenManager, ConcurrentCallersShareOneFetch) {
    StubHttpServer srv([](const StubRequest&) {
        StubResponse r{200, "application/json", R"({"access_token":"SHARED","expires_in":3600})"};
        r.delay = std::chrono::milliseconds(300);
        return r;
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    constexpr int kCallers = 16;
    std::vector<std::thread> threads;
    std::mutex mtx;
    std::vector<std::string> tokens;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&]() {
            auto r = mgr.GetToken();
            std::lock_guard<std::mutex> lk(mtx);
            tokens.push_back(r.ok() ? r.credential->token : std::string("<failed>"));
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(srv.hits(), 1);
    ASSERT_EQ(tokens.size(), static_cast<std::size_t>(kCallers));
    for (const auto& t : tokens) {
        EXPECT_EQ(t, "SHARED");
    }
    EXPECT_EQ(mgr.Status().refreshCount, 1u);
    srv.stop();
}

TEST(TokenManager, ConcurrentCallersShareOneFailure) {
    StubHttpServer srv([](const StubRequest&) {
        StubResponse r{503, "text/plain", "maintenance"};
        r.delay = std::chrono::milliseconds(200);
        return r;
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto r = mgr.GetToken();
            if (!r.ok() && r.error->category == errors::ErrorCategory::AuthFailure) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(failures.load(), 8);
    EXPECT_GE(srv.hits(), 1);
    EXPECT_FALSE(store.Get().has_value());
    srv.stop();
}

TEST(TokenManager, MissingAccessTokenIsAuthFailure) {
    StubHttpServer srv([](const StubRequest&) {
        return StubResponse{200, "application/json", R"({"expires_in":60})"};
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    auto r = mgr.GetToken();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->category, errors::ErrorCategory::AuthFailure);
    EXPECT_NE(r.error->message.find("access_token"), std::string::npos);
    EXPECT_FALSE(store.Get().has_value());
    auto st = mgr.Status();
    EXPECT_EQ(st.oauthStatus, "Refresh failed");
    EXPECT_EQ(st.refreshCount, 0u);
    EXPECT_FALSE(st.lastError.empty());
    srv.stop();
}

TEST(TokenManager, NonSuccessStatusIsAuthFailure) {
    StubHttpServer srv([](const StubRequest&) {
        return StubResponse{401, "application/json", R"({"error":"invalid_client"})"};
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    auto r = mgr.GetToken();
    ASSERT_FALSE(r.ok());
    EXPECT_NE(r.error->message.find("HTTP 401"), std::string::npos);
    EXPECT_NE(r.error->message.find("invalid_client"), std::string::npos);
    srv.stop();
}

TEST(TokenManager, MalformedJsonIsAuthFailure) {
    StubHttpServer srv([](const StubRequest&) {
        return StubResponse{200, "application/json", "<html>oops</html>"};
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    auto r = mgr.GetToken();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->category, errors::ErrorCategory::AuthFailure);
    srv.stop();
}

TEST(TokenManager, UnreachableEndpointIsAuthFailure) {
    OAuthConfig cfg;
    cfg.endpoint = std::string("http://127.0.0.1:") + std::to_string(relaytest::UnusedPort()) + "/token";
    TokenStore store;
    TokenManager mgr(cfg, store, fastOptions());

    auto r = mgr.GetToken();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->category, errors::ErrorCategory::AuthFailure);
    EXPECT_NE(r.error->message.find("OAuth request"), std::string::npos);
}

TEST(TokenManager, MissingEndpointIsAuthFailure) {
    TokenStore store;
    TokenManager mgr(OAuthConfig{}, store);
    auto r = mgr.GetToken();
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(mgr.Status().oauthStatus, "Refresh failed");
}

TEST(TokenManager, ForceRefreshBypassesValidCache) {
    std::atomic<int> served{0};
    StubHttpServer srv([&served](const StubRequest&) {
        int n = ++served;
        return StubResponse{200, "application/json", "{\"access_token\":\"v" + std::to_string(n) + "\"}"};
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());
    std::vector<std::string> published;
    mgr.setTokenPublisher([&published](const std::string& t) { published.push_back(t); });

    ASSERT_TRUE(mgr.GetToken().ok());
    auto r = mgr.ForceRefresh();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.credential->token, "v2");
    EXPECT_EQ(srv.hits(), 2);
    EXPECT_EQ(mgr.Status().refreshCount, 2u);
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published.back(), "v2");
    srv.stop();
}

TEST(TokenManager, BackgroundRefreshFiresRepeatedly) {
    OAuthConfig cfg;
    cfg.mockMode = true;
    TokenStore store;
    TokenManager mgr(cfg, store);

    std::mutex mtx;
    std::vector<std::string> events;
    mgr.setEventSink([&](log::Severity, const std::string& message, const std::optional<std::string>&) {
        std::lock_guard<std::mutex> lk(mtx);
        events.push_back(message);
    });

    mgr.StartBackgroundRefresh(std::chrono::milliseconds(50));
    EXPECT_TRUE(mgr.backgroundRefreshRunning());
    std::uint64_t lastCount = 0;
    std::optional<TimePoint> lastAt;
    for (int round = 0; round < 3; ++round) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (mgr.Status().refreshCount <= lastCount && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        auto st = mgr.Status();
        ASSERT_GT(st.refreshCount, lastCount);
        ASSERT_TRUE(st.lastRefresh.has_value());
        if (lastAt) {
            EXPECT_GE(*st.lastRefresh, *lastAt);
        }
        lastCount = st.refreshCount;
        lastAt = st.lastRefresh;
    }
    mgr.StopBackgroundRefresh();
    EXPECT_FALSE(mgr.backgroundRefreshRunning());

    const auto stoppedAt = mgr.Status().refreshCount;
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(mgr.Status().refreshCount, stoppedAt);

    std::lock_guard<std::mutex> lk(mtx);
    int refreshing = 0;
    for (const auto& e : events) {
        if (e == "Refreshing OAuth token (background)") { ++refreshing; }
    }
    EXPECT_GE(refreshing, 3);
}

TEST(TokenManager, BackgroundFailureKeepsStaleToken) {
    std::atomic<bool> failNow{false};
    StubHttpServer srv([&failNow](const StubRequest&) {
        if (failNow.load()) {
            return StubResponse{500, "text/plain", "down"};
        }
        return StubResponse{200, "application/json", R"({"access_token":"STALE","expires_in":3600})"};
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());
    std::atomic<int> warnings{0};
    mgr.setEventSink([&warnings](log::Severity s, const std::string& message, const std::optional<std::string>&) {
        if (s == log::Severity::Warning && message == "Failed to refresh OAuth token") { ++warnings; }
    });

    ASSERT_TRUE(mgr.GetToken().ok());
    failNow.store(true);
    mgr.StartBackgroundRefresh(std::chrono::milliseconds(30));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (warnings.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    mgr.StopBackgroundRefresh();
    EXPECT_GE(warnings.load(), 1);

    auto r = mgr.GetToken();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.credential->token, "STALE");
    EXPECT_EQ(mgr.Status().oauthStatus, "Refresh failed");
    srv.stop();
}

TEST(TokenManager, HugeExpiresInIsClampedAndCached) {
    std::atomic<int> served{0};
    StubHttpServer srv([&served](const StubRequest&) {
        // Alternate between an int64-max integer and a double beyond int64
        const bool integer = (served.fetch_add(1) % 2) == 0;
        return StubResponse{200, "application/json",
                            integer ? R"({"access_token":"LONG","expires_in":9223372036854775807})"
                                    : R"({"access_token":"LONG","expires_in":1e30})"};
    });
    srv.start();
    FakeClock clock;
    TokenManagerOptions opts = fastOptions();
    opts.clock = clock.fn();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, opts);

    auto r = mgr.GetToken();
    ASSERT_TRUE(r.ok());
    EXPECT_GT(r.credential->expiresAt, r.credential->obtainedAt);
    EXPECT_EQ(r.credential->expiresAt,
              clock.base + std::chrono::seconds(TokenManager::kMaxExpiresInSeconds) - opts.safetyMargin);
    ASSERT_TRUE(mgr.GetToken().ok());
    EXPECT_EQ(srv.hits(), 1);

    auto forced = mgr.ForceRefresh();
    ASSERT_TRUE(forced.ok());
    // Out-of-range double falls back to the default lifetime
    EXPECT_EQ(forced.credential->expiresAt,
              clock.base + std::chrono::seconds(TokenManager::kDefaultExpiresInSeconds) - opts.safetyMargin);
    ASSERT_TRUE(mgr.GetToken().ok());
    EXPECT_EQ(srv.hits(), 2);
    srv.stop();
}

TEST(TokenManager, SlowEndpointTimesOutAsAuthFailure) {
    StubHttpServer srv([](const StubRequest&) {
        StubResponse r{200, "application/json", R"({"access_token":"LATE"})"};
        r.delay = std::chrono::milliseconds(4000);
        return r;
    });
    srv.start();
    TokenStore store;
    TokenManager mgr(remoteConfig(srv), store, fastOptions());

    const auto started = std::chrono::steady_clock::now();
    auto r = mgr.GetToken();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(3500));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->category, errors::ErrorCategory::AuthFailure);
    EXPECT_EQ(r.error->message, "OAuth request timed out after 1500ms");
    EXPECT_FALSE(store.Get().has_value());
    auto st = mgr.Status();
    EXPECT_EQ(st.oauthStatus, "Refresh failed");
    EXPECT_EQ(st.lastError, r.error->message);
    srv.stop();
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_status_aggregator.cpp
// Purpose: GoogleTests for the status snapshot and its JSON document
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>

#include "relay/JSONValue.h"
#include "relay/status/StatusAggregator.hpp"
#include "relay/version.h"

using namespace relay;
using relay::status::StatusAggregator;
using relay::status::StatusInfo;

namespace {

const std::chrono::system_clock::time_point kStart{std::chrono::seconds(1700000000)};

const JSONValue& member(const JSONValue& doc, const std::string& key) {
    const JSONValue* v = doc.find(key);
    if (v == nullptr) {
        throw std::runtime_error("missing key " + key);
    }
    return *v;
}

bool isNull(const JSONValue& v) { return std::holds_alternative<std::nullptr_t>(v.value); }

struct Fixture {
    token::TokenStore store;
    token::TokenManager tokens;
    log::RequestLogger logger;

    explicit Fixture(bool mock)
        : tokens(makeConfig(mock), store, makeOptions()), logger(100, 50, []() { return kStart; }) {}

    static token::OAuthConfig makeConfig(bool mock) {
        token::OAuthConfig c;
        c.mockMode = mock;
        c.clientId = "client-a";
        c.clientSecret = "very-secret-value";
        return c;
    }
    static token::TokenManagerOptions makeOptions() {
        token::TokenManagerOptions o;
        o.clock = []() { return kStart; };
        return o;
    }
};

StatusInfo infoFor() {
    StatusInfo info;
    info.config = {{"MOCK_MODE", "true"}, {"OAUTH_CLIENT_ID", "client-a"}};
    info.proxyUrl = "http://127.0.0.1:8889";
    info.startedAt = kStart;
    return info;
}

} // namespace

TEST(StatusAggregator, ReportsMockTokenState) {
    Fixture f(true);
    ASSERT_TRUE(f.tokens.GetToken().ok());
    StatusAggregator agg(f.tokens, f.logger, infoFor(), []() { return kStart + std::chrono::seconds(42); });

    auto snap = agg.Snapshot();
    EXPECT_EQ(snap.uptime.count(), 42);
    EXPECT_EQ(snap.version, relay::getVersionString());
    EXPECT_TRUE(snap.token.tokenValid);
    EXPECT_EQ(snap.token.oauthStatus, "Mock mode");
    EXPECT_EQ(snap.token.refreshCount, 1u);
    ASSERT_TRUE(snap.token.expiresAt.has_value());
    EXPECT_EQ(*snap.token.expiresAt, kStart + std::chrono::hours(24));
}

TEST(StatusAggregator, JsonCarriesAllSections) {
    Fixture f(true);
    ASSERT_TRUE(f.tokens.GetToken().ok());
    f.logger.Append(log::Severity::Info, "Proxy server started", std::string("Listening on http://127.0.0.1:8889"));
    StatusAggregator agg(f.tokens, f.logger, infoFor(), []() { return kStart + std::chrono::seconds(42); });

    const std::string text = StatusAggregator::ToJSON(agg.Snapshot());
    auto doc = ParseJSON(text);
    ASSERT_TRUE(doc.has_value()) << text;
    ASSERT_TRUE(doc->isObject());

    EXPECT_EQ(GetIntMember(*doc, "uptime"), 42);
    EXPECT_EQ(GetStringMember(*doc, "version"), relay::getVersionString());
    EXPECT_EQ(GetIntMember(*doc, "token_refresh_count"), 1);
    EXPECT_EQ(GetStringMember(*doc, "oauth_status"), std::string("Mock mode"));
    EXPECT_TRUE(isNull(member(*doc, "oauth_last_error")));
    EXPECT_TRUE(std::get<bool>(member(*doc, "token_valid").value));
    EXPECT_TRUE(member(*doc, "token_expires_at").isString());
    EXPECT_TRUE(member(*doc, "last_token_refresh").isString());
    EXPECT_EQ(GetIntMember(*doc, "api_request_count"), 0);
    EXPECT_EQ(GetIntMember(*doc, "api_response_count"), 0);
    EXPECT_EQ(GetIntMember(*doc, "api_error_count"), 0);
    EXPECT_TRUE(isNull(member(*doc, "last_request_time")));
    EXPECT_TRUE(isNull(member(*doc, "last_response_time")));
    EXPECT_TRUE(isNull(member(*doc, "log_file")));
    EXPECT_EQ(GetStringMember(*doc, "proxy_url"), std::string("http://127.0.0.1:8889"));

    const auto& events = std::get<JSONValue::Array>(member(*doc, "events").value);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(GetStringMember(*events[0], "type"), std::string("info"));
    EXPECT_EQ(GetStringMember(*events[0], "message"), std::string("Proxy server started"));
    EXPECT_EQ(GetStringMember(*events[0], "details"), std::string("Listening on http://127.0.0.1:8889"));

    const auto& config = member(*doc, "config");
    ASSERT_TRUE(config.isObject());
    EXPECT_EQ(GetStringMember(config, "OAUTH_CLIENT_ID"), std::string("client-a"));
    EXPECT_TRUE(member(*doc, "api_requests").isArray());
}

TEST(StatusAggregator, NeverExposesTheClientSecret) {
    Fixture f(true);
    ASSERT_TRUE(f.tokens.GetToken().ok());
    StatusAggregator agg(f.tokens, f.logger, infoFor());
    const std::string text = StatusAggregator::ToJSON(agg.Snapshot());
    EXPECT_EQ(text.find("very-secret-value"), std::string::npos);
    EXPECT_EQ(text.find(token::TokenManager::kMockToken), std::string::npos);
}

TEST(StatusAggregator, ReportsFailedRefresh) {
    Fixture f(false);
    ASSERT_FALSE(f.tokens.GetToken().ok());
    StatusAggregator agg(f.tokens, f.logger, infoFor());
    auto doc = ParseJSON(StatusAggregator::ToJSON(agg.Snapshot()));
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(GetStringMember(*doc, "oauth_status"), std::string("Refresh failed"));
    EXPECT_TRUE(member(*doc, "oauth_last_error").isString());
    EXPECT_FALSE(std::get<bool>(member(*doc, "token_valid").value));
    EXPECT_TRUE(isNull(member(*doc, "token_expires_at")));
}

TEST(StatusAggregator, RendersEachRequestOutcome) {
    Fixture f(true);
    auto record = [&f](std::uint64_t id, std::optional<std::int64_t> maxTokens) {
        log::ProxyRequest r;
        r.id = id;
        r.receivedAt = kStart;
        r.model = "gpt-x";
        r.messageCount = 2;
        r.maxTokens = maxTokens;
        f.logger.RecordRequest(r);
    };
    record(1, 100);
    record(2, std::nullopt);
    record(3, std::nullopt);
    record(4, std::nullopt);
    record(5, std::nullopt);
    f.logger.SetOutcome(1, log::OutcomeSuccess{"stop", 12, std::chrono::duration<double>(1.234)});
    f.logger.SetOutcome(2, log::OutcomeSuccess{"length", 99, std::chrono::duration<double>(0.5)});
    f.logger.SetOutcome(3, log::OutcomeUpstreamError{429, "HTTP 429: slow down"});
    f.logger.SetOutcome(4, log::OutcomeTransportError{"Request timed out after 120 seconds", true});

    StatusAggregator agg(f.tokens, f.logger, infoFor());
    auto doc = ParseJSON(StatusAggregator::ToJSON(agg.Snapshot()));
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(GetIntMember(*doc, "api_request_count"), 5);
    EXPECT_EQ(GetIntMember(*doc, "api_response_count"), 2);
    EXPECT_EQ(GetIntMember(*doc, "api_error_count"), 2);
    EXPECT_TRUE(member(*doc, "last_request_time").isString());

    const auto& reqs = std::get<JSONValue::Array>(member(*doc, "api_requests").value);
    ASSERT_EQ(reqs.size(), 5u);
    // Most recent first
    EXPECT_EQ(GetIntMember(*reqs[0], "id"), 5);
    EXPECT_EQ(GetStringMember(*reqs[0], "status"), std::string("pending"));
    EXPECT_TRUE(isNull(member(*reqs[0], "max_tokens")));

    EXPECT_EQ(GetStringMember(*reqs[1], "status"), std::string("error"));
    EXPECT_TRUE(std::get<bool>(member(*reqs[1], "timed_out").value));

    EXPECT_EQ(GetStringMember(*reqs[2], "status"), std::string("error"));
    EXPECT_EQ(GetIntMember(*reqs[2], "http_status"), 429);
    EXPECT_EQ(GetStringMember(*reqs[2], "error"), std::string("HTTP 429: slow down"));

    EXPECT_EQ(GetStringMember(*reqs[3], "status"), std::string("warning"));
    EXPECT_EQ(GetStringMember(*reqs[3], "finish_reason"), std::string("length"));

    EXPECT_EQ(GetStringMember(*reqs[4], "status"), std::string("success"));
    EXPECT_EQ(GetIntMember(*reqs[4], "tokens_used"), 12);
    EXPECT_EQ(GetStringMember(*reqs[4], "elapsed_time"), std::string("1.23s"));
    EXPECT_EQ(GetIntMember(*reqs[4], "max_tokens"), 100);
    EXPECT_EQ(GetIntMember(*reqs[4], "messages_count"), 2);
    EXPECT_EQ(GetStringMember(*reqs[4], "model"), std::string("gpt-x"));
}

TEST(StatusAggregator, TimestampFormatHasMilliseconds) {
    const auto at = kStart + std::chrono::milliseconds(7);
    const std::string s = StatusAggregator::FormatTimestamp(at);
    ASSERT_EQ(s.size(), 23u);
    EXPECT_EQ(s[10], 'T');
    EXPECT_EQ(s.substr(19), ".007");
}

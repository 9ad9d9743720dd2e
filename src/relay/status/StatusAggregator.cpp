//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/status/StatusAggregator.cpp
// Purpose: Status snapshot and its JSON rendering
//==========================================================================================================

#include <ctime>
#include <memory>
#include <variant>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include "relay/JSONValue.h"
#include "relay/status/StatusAggregator.hpp"
#include "relay/version.h"

namespace relay::status {

namespace {

std::shared_ptr<JSONValue> optionalTime(const std::optional<log::TimePoint>& at) {
    return at ? MakeJSON(StatusAggregator::FormatTimestamp(*at)) : MakeJSONNull();
}

std::shared_ptr<JSONValue> eventJSON(const log::LogEntry& e) {
    JSONValue::Object o;
    o["timestamp"] = MakeJSON(StatusAggregator::FormatTimestamp(e.timestamp));
    o["type"] = MakeJSON(log::severityName(e.severity));
    o["message"] = MakeJSON(e.message);
    o["details"] = e.details ? MakeJSON(*e.details) : MakeJSONNull();
    return std::make_shared<JSONValue>(std::move(o));
}

// Adds the outcome-dependent members of one api_requests entry.
struct OutcomeFields {
    JSONValue::Object& o;

    void operator()(const log::OutcomeSuccess& s) const {
        o["status"] = MakeJSON(s.finishReason == "stop" ? "success" : "warning");
        o["finish_reason"] = MakeJSON(s.finishReason);
        o["tokens_used"] = MakeJSON(static_cast<int64_t>(s.totalTokens));
        o["elapsed_time"] = MakeJSON(fmt::format("{:.2f}s", s.elapsed.count()));
    }
    void operator()(const log::OutcomeUpstreamError& e) const {
        o["status"] = MakeJSON("error");
        o["http_status"] = MakeJSON(static_cast<int64_t>(e.statusCode));
        o["error"] = MakeJSON(e.message);
    }
    void operator()(const log::OutcomeTransportError& e) const {
        o["status"] = MakeJSON("error");
        o["timed_out"] = MakeJSON(e.timedOut);
        o["error"] = MakeJSON(e.message);
    }
    void operator()(const log::OutcomeAuthError& e) const {
        o["status"] = MakeJSON("error");
        o["error"] = MakeJSON(e.message);
    }
};

std::shared_ptr<JSONValue> requestJSON(const log::RequestRecord& r) {
    JSONValue::Object o;
    o["id"] = MakeJSON(static_cast<int64_t>(r.request.id));
    o["timestamp"] = MakeJSON(StatusAggregator::FormatTimestamp(r.request.receivedAt));
    o["model"] = MakeJSON(r.request.model);
    o["messages_count"] = MakeJSON(static_cast<int64_t>(r.request.messageCount));
    o["max_tokens"] = r.request.maxTokens ? MakeJSON(static_cast<int64_t>(*r.request.maxTokens)) : MakeJSONNull();
    if (r.outcome) {
        std::visit(OutcomeFields{o}, *r.outcome);
    } else {
        o["status"] = MakeJSON("pending");
    }
    return std::make_shared<JSONValue>(std::move(o));
}

} // namespace

StatusAggregator::StatusAggregator(const token::TokenManager& tokenManager,
                                   const log::RequestLogger& requestLogger,
                                   StatusInfo staticInfo,
                                   std::function<log::TimePoint()> clk)
    : tokens(tokenManager), logger(requestLogger), info(std::move(staticInfo)), clock(std::move(clk)) {}

std::string StatusAggregator::FormatTimestamp(log::TimePoint at) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}",
                       fmt::localtime(std::chrono::system_clock::to_time_t(at)),
                       static_cast<int>(millis < 0 ? millis + 1000 : millis));
}

StatusSnapshot StatusAggregator::Snapshot() const {
    StatusSnapshot s;
    s.version = relay::getVersionString();
    s.takenAt = clock ? clock() : std::chrono::system_clock::now();
    s.uptime = std::chrono::duration_cast<std::chrono::seconds>(s.takenAt - info.startedAt);
    if (s.uptime.count() < 0) {
        s.uptime = std::chrono::seconds(0);
    }
    s.token = tokens.Status();
    s.events = logger.Snapshot();
    s.requests = logger.RequestsSnapshot();
    s.counters = logger.Counters();
    s.info = info;
    return s;
}

std::string StatusAggregator::ToJSON(const StatusSnapshot& s) {
    JSONValue::Object root;
    root["version"] = MakeJSON(s.version);
    root["uptime"] = MakeJSON(static_cast<int64_t>(s.uptime.count()));

    JSONValue::Array events;
    events.reserve(s.events.size());
    for (const auto& e : s.events) {
        events.push_back(eventJSON(e));
    }
    root["events"] = std::make_shared<JSONValue>(std::move(events));

    root["token_refresh_count"] = MakeJSON(static_cast<int64_t>(s.token.refreshCount));
    root["last_token_refresh"] = optionalTime(s.token.lastRefresh);
    root["oauth_status"] = MakeJSON(s.token.oauthStatus);
    root["oauth_last_error"] = s.token.lastError.empty() ? MakeJSONNull() : MakeJSON(s.token.lastError);
    root["token_valid"] = MakeJSON(s.token.tokenValid);
    root["token_expires_at"] = optionalTime(s.token.expiresAt);

    root["api_request_count"] = MakeJSON(static_cast<int64_t>(s.counters.requests));
    root["api_response_count"] = MakeJSON(static_cast<int64_t>(s.counters.responses));
    root["api_error_count"] = MakeJSON(static_cast<int64_t>(s.counters.errors));
    root["last_request_time"] = optionalTime(s.counters.lastRequest);
    root["last_response_time"] = optionalTime(s.counters.lastResponse);

    JSONValue::Array requests;
    requests.reserve(s.requests.size());
    for (const auto& r : s.requests) {
        requests.push_back(requestJSON(r));
    }
    root["api_requests"] = std::make_shared<JSONValue>(std::move(requests));

    JSONValue::Object config;
    for (const auto& kv : s.info.config) {
        config[kv.first] = MakeJSON(kv.second);
    }
    root["config"] = std::make_shared<JSONValue>(std::move(config));
    root["proxy_url"] = MakeJSON(s.info.proxyUrl);
    root["log_file"] = s.info.logFile.empty() ? MakeJSONNull() : MakeJSON(s.info.logFile);

    return SerializeJSON(JSONValue(std::move(root)));
}

} // namespace relay::status

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/proxy/ForwardingProxy.cpp
// Purpose: Forwarding proxy request path
//==========================================================================================================

#include <chrono>
#include <utility>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "relay/JSONValue.h"
#include "relay/proxy/ForwardingProxy.hpp"

namespace relay::proxy {

namespace {

std::string finishReasonOf(const JSONValue& doc) {
    const JSONValue* choices = doc.find("choices");
    if (choices == nullptr || !choices->isArray()) {
        return "unknown";
    }
    const auto& arr = std::get<JSONValue::Array>(choices->value);
    if (arr.empty() || !arr.front() || !arr.front()->isObject()) {
        return "unknown";
    }
    return GetStringMember(*arr.front(), "finish_reason").value_or("unknown");
}

std::int64_t totalTokensOf(const JSONValue& doc) {
    const JSONValue* usage = doc.find("usage");
    if (usage == nullptr || !usage->isObject()) {
        return 0;
    }
    if (auto total = GetIntMember(*usage, "total_tokens")) {
        return *total;
    }
    return GetIntMember(*usage, "prompt_tokens").value_or(0) + GetIntMember(*usage, "completion_tokens").value_or(0);
}

std::size_t messageCountOf(const JSONValue& doc) {
    const JSONValue* messages = doc.find("messages");
    if (messages == nullptr || !messages->isArray()) {
        return 0;
    }
    return std::get<JSONValue::Array>(messages->value).size();
}

http::HttpResponse plainText(int status, std::string body) {
    return http::HttpResponse{status, "text/plain", std::move(body)};
}

} // namespace

ForwardingProxy::ForwardingProxy(ProxyOptions options,
                                 token::ITokenSource& tokenSource,
                                 log::RequestLogger& requestLogger,
                                 log::Transcript* transcriptFile,
                                 http::CallCanceller* callCanceller)
    : opts(std::move(options)),
      completionsUrl(JoinUrl(opts.upstreamBaseUrl, "chat/completions")),
      tokens(tokenSource),
      logger(requestLogger),
      transcript(transcriptFile),
      canceller(callCanceller) {}

std::string ForwardingProxy::JoinUrl(const std::string& base, const std::string& path) {
    std::string left = base;
    while (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    std::size_t skip = 0;
    while (skip < path.size() && path[skip] == '/') {
        ++skip;
    }
    return left + "/" + path.substr(skip);
}

log::TimePoint ForwardingProxy::now() const {
    return opts.clock ? opts.clock() : std::chrono::system_clock::now();
}

std::uint64_t ForwardingProxy::lastAssignedId() const {
    std::lock_guard<std::mutex> lk(idMtx);
    return lastId;
}

http::HttpResponse ForwardingProxy::fail(std::uint64_t id, log::ProxyOutcome outcome, int status, const std::string& message) {
    LOG_ERROR("Request #{} failed ({}): {}", id, status, message);
    logger.SetOutcome(id, std::move(outcome));
    logger.Append(log::Severity::Error, fmt::format("API Error #{}", id), message.substr(0, kEventDetailLimit));
    if (transcript != nullptr) {
        transcript->WriteError(id, message);
    }
    return plainText(status, message);
}

http::HttpResponse ForwardingProxy::Handle(const http::HttpRequest& request) {
    const log::TimePoint receivedAt = now();

    std::string parseError;
    auto doc = ParseJSON(request.body, &parseError);
    if (!doc.has_value() || !doc->isObject()) {
        const std::string why = doc.has_value() ? std::string("request body is not a JSON object") : parseError;
        LOG_WARN("Rejecting inbound request with invalid JSON: {}", why);
        logger.RecordRejected();
        logger.Append(log::Severity::Error, "Invalid JSON request", why.substr(0, kEventDetailLimit));
        if (transcript != nullptr) {
            transcript->WriteError(0, std::string("Invalid JSON: ") + why);
        }
        return plainText(400, "Invalid JSON");
    }

    log::ProxyRequest pr;
    pr.receivedAt = receivedAt;
    pr.model = GetStringMember(*doc, "model").value_or("unknown");
    pr.messageCount = messageCountOf(*doc);
    pr.maxTokens = GetIntMember(*doc, "max_tokens");
    pr.rawBody = request.body;
    {
        std::lock_guard<std::mutex> lk(idMtx);
        pr.id = ++lastId;
        logger.RecordRequest(pr);
    }
    const std::uint64_t id = pr.id;
    const std::string maxTokens = pr.maxTokens ? std::to_string(*pr.maxTokens) : std::string("not set");
    LOG_INFO("REQUEST #{} model={} messages={} max_tokens={}", id, pr.model, pr.messageCount, maxTokens);
    logger.Append(log::Severity::Info, fmt::format("API Request #{}", id),
                  fmt::format("Model: {}, Max tokens: {}", pr.model, maxTokens));
    if (transcript != nullptr) {
        transcript->WriteRequest(pr);
    }

    auto token = tokens.GetToken();
    if (!token.ok()) {
        const std::string msg = std::string("No OAuth token available: ") + token.error->message;
        return fail(id, log::OutcomeAuthError{msg}, 401, msg);
    }

    http::HttpCallParams params;
    params.url = completionsUrl;
    params.contentType = "application/json";
    params.body = request.body;
    params.headers.push_back(http::HeaderKV{"Authorization", std::string("Bearer ") + token.credential->token});
    params.caFile = opts.caFile;
    params.caPath = opts.caPath;
    params.connectTimeoutMs = opts.upstreamTimeoutMs;
    params.readTimeoutMs = opts.upstreamTimeoutMs;

    LOG_DEBUG("REQUEST #{} forwarding to {}", id, completionsUrl);
    const auto started = std::chrono::steady_clock::now();
    const auto resp = http::PostSync(params, canceller);
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;

    if (!resp.completed) {
        if (resp.cancelled) {
            const std::string msg("Request cancelled: relay is shutting down");
            return fail(id, log::OutcomeTransportError{msg, false}, 503, msg);
        }
        if (resp.timedOut) {
            const std::string msg = fmt::format("Request timed out after {:g} seconds", opts.upstreamTimeoutMs / 1000.0);
            return fail(id, log::OutcomeTransportError{msg, true}, 504, msg);
        }
        const std::string msg = std::string("Request failed: ") + resp.error;
        return fail(id, log::OutcomeTransportError{msg, false}, 500, msg);
    }

    if (resp.status != 200) {
        const std::string msg = fmt::format("HTTP {}: {}", resp.status, resp.body.substr(0, kErrorBodyPrefix));
        return fail(id, log::OutcomeUpstreamError{resp.status, msg}, resp.status, msg);
    }

    auto answer = ParseJSON(resp.body);
    if (!answer.has_value() || !answer->isObject()) {
        const std::string msg = std::string("Invalid JSON response: ") + resp.body.substr(0, kErrorBodyPrefix);
        return fail(id, log::OutcomeUpstreamError{resp.status, msg}, 500, msg);
    }

    log::OutcomeSuccess ok;
    ok.finishReason = finishReasonOf(*answer);
    ok.totalTokens = totalTokensOf(*answer);
    ok.elapsed = elapsed;

    LOG_INFO("RESPONSE #{} finish={} tokens={} took {:.2f}s", id, ok.finishReason, ok.totalTokens, elapsed.count());
    logger.SetOutcome(id, ok);
    logger.Append(ok.finishReason == "stop" ? log::Severity::Success : log::Severity::Warning,
                  fmt::format("API Response #{} ({:.1f}s)", id, elapsed.count()),
                  fmt::format("Finish: {}, Tokens: {}", ok.finishReason, ok.totalTokens));
    if (transcript != nullptr) {
        transcript->WriteResponse(id, ok, resp.body);
    }
    if (ok.finishReason == "length") {
        const std::string warning = fmt::format("WARNING: Response #{} was cut off (finish_reason=length)", id);
        LOG_WARN("{}", warning);
        logger.Append(log::Severity::Warning, warning, std::string("Consider increasing MAX_TOKENS"));
        if (transcript != nullptr) {
            transcript->WriteWarning(id, warning);
        }
    }

    return http::HttpResponse{200, "application/json", resp.body};
}

} // namespace relay::proxy

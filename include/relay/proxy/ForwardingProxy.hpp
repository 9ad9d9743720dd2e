//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/proxy/ForwardingProxy.hpp
// Purpose: Relays chat-completion requests upstream with an injected bearer token and records outcomes
//==========================================================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "relay/http/HttpClient.hpp"
#include "relay/http/HttpServer.hpp"
#include "relay/log/RequestLogger.hpp"
#include "relay/log/Transcript.hpp"
#include "relay/token/ITokenSource.hpp"

namespace relay::proxy {

//==========================================================================================================
// ProxyOptions
// Fields:
//   upstreamBaseUrl: Base URL; "chat/completions" is appended with exactly one separating slash.
//   upstreamTimeoutMs: Bound on the whole upstream exchange.
//   caFile/caPath: Optional trust anchors for an https upstream.
//   clock: Source of request timestamps (system clock when empty).
//==========================================================================================================
struct ProxyOptions {
    std::string upstreamBaseUrl;
    unsigned int upstreamTimeoutMs{120000};
    std::string caFile;
    std::string caPath;
    std::function<log::TimePoint()> clock;
};

//==========================================================================================================
// ForwardingProxy
// Purpose: Stateless request handler apart from the id counter; safe to call from many workers at once.
// Notes:
//   - Every accepted request gets exactly one outcome in the RequestLogger.
//   - transcript and canceller are optional and non-owning.
//==========================================================================================================
class ForwardingProxy {
public:
    static constexpr std::size_t kErrorBodyPrefix = 500;
    static constexpr std::size_t kEventDetailLimit = 200;

    ForwardingProxy(ProxyOptions options,
                    token::ITokenSource& tokens,
                    log::RequestLogger& logger,
                    log::Transcript* transcript = nullptr,
                    http::CallCanceller* canceller = nullptr);

    http::HttpResponse Handle(const http::HttpRequest& request);

    // JoinUrl("https://h/v1/", "chat/completions") == JoinUrl("https://h/v1", "/chat/completions")
    static std::string JoinUrl(const std::string& base, const std::string& path);

    std::uint64_t lastAssignedId() const;

private:
    log::TimePoint now() const;
    http::HttpResponse fail(std::uint64_t id, log::ProxyOutcome outcome, int status, const std::string& message);

    const ProxyOptions opts;
    const std::string completionsUrl;
    token::ITokenSource& tokens;
    log::RequestLogger& logger;
    log::Transcript* transcript;
    http::CallCanceller* canceller;

    mutable std::mutex idMtx;
    std::uint64_t lastId{0};
};

} // namespace relay::proxy

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/app/RelayApp.hpp
// Purpose: Owns and wires the relay components; startup, routing and graceful shutdown
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "relay/app/RelayConfig.hpp"
#include "relay/http/HttpClient.hpp"
#include "relay/http/HttpServer.hpp"
#include "relay/log/RequestLogger.hpp"
#include "relay/log/Transcript.hpp"
#include "relay/proxy/ForwardingProxy.hpp"
#include "relay/status/StatusAggregator.hpp"
#include "relay/token/TokenManager.hpp"
#include "relay/token/TokenStore.hpp"

namespace relay::app {

//==========================================================================================================
// RelayApp
// Purpose: One relay instance. Routes GET /api/state to the status view and every POST to the proxy.
// Notes:
//   - Start() throws std::runtime_error when the listener cannot bind.
//   - Stop() is idempotent and also runs from the destructor.
//==========================================================================================================
class RelayApp {
public:
    explicit RelayApp(RelayConfig config);
    ~RelayApp();

    RelayApp(const RelayApp&) = delete;
    RelayApp& operator=(const RelayApp&) = delete;

    void Start();
    void Stop();

    http::HttpResponse Route(const http::HttpRequest& request);

    unsigned short port() const { return server.boundPort(); }
    std::string proxyUrl() const;
    std::string transcriptPath() const;

    token::TokenManager& tokenManager() { return tokens; }
    log::RequestLogger& requestLogger() { return logger; }

private:
    void publishToken(const std::string& token);

    const RelayConfig cfg;
    const log::TimePoint startedAt;
    std::string listenAddress;

    token::TokenStore store;
    token::TokenManager tokens;
    log::RequestLogger logger;
    std::unique_ptr<log::Transcript> transcript;
    http::CallCanceller canceller;
    proxy::ForwardingProxy proxy;
    std::unique_ptr<status::StatusAggregator> status;
    http::HttpServer server;
    bool running{false};
};

} // namespace relay::app

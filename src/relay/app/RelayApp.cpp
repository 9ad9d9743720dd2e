//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/app/RelayApp.cpp
// Purpose: Relay wiring, routing and shutdown sequence
//==========================================================================================================

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "relay/app/RelayApp.hpp"
#include "relay/version.h"

namespace relay::app {

namespace {

constexpr std::chrono::seconds kCancelWindow{2};

std::unique_ptr<log::Transcript> openTranscript(const std::string& dir, log::TimePoint at) {
    if (dir.empty()) {
        return nullptr;
    }
    const auto path = std::filesystem::path(dir) / log::Transcript::FileNameFor(at);
    return std::make_unique<log::Transcript>(path.string());
}

proxy::ProxyOptions proxyOptionsFor(const RelayConfig& cfg) {
    proxy::ProxyOptions o;
    o.upstreamBaseUrl = cfg.upstreamBaseUrl;
    o.upstreamTimeoutMs = cfg.upstreamTimeoutMs;
    o.caFile = cfg.oauth.caFile;
    o.caPath = cfg.oauth.caPath;
    return o;
}

http::HttpServer::Options serverOptionsFor(const RelayConfig& cfg) {
    auto o = http::HttpServer::FromListenUrl(cfg.listenUrl);
    o.maxBodyBytes = cfg.maxRequestBytes;
    return o;
}

std::string stripQuery(const std::string& target) {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

} // namespace

RelayApp::RelayApp(RelayConfig config)
    : cfg(std::move(config)),
      startedAt(std::chrono::system_clock::now()),
      tokens(cfg.oauth, store),
      transcript(openTranscript(cfg.logDir, startedAt)),
      proxy(proxyOptionsFor(cfg), tokens, logger, transcript.get(), &canceller),
      server(serverOptionsFor(cfg)) {
    // Environment reads that would otherwise happen on worker threads are done here, before the
    // token publisher can setenv() from the refresh thread
    ::tzset();
    (void)http::SystemTrustPaths();
    listenAddress = http::HttpServer::FromListenUrl(cfg.listenUrl).address;
    tokens.setEventSink([this](log::Severity severity, const std::string& message, const std::optional<std::string>& details) {
        logger.Append(severity, message, details);
    });
    tokens.setTokenPublisher([this](const std::string& token) { publishToken(token); });
}

RelayApp::~RelayApp() {
    Stop();
    tokens.StopBackgroundRefresh();
}

void RelayApp::publishToken(const std::string& token) {
    if (cfg.tokenEnvVar.empty()) {
        return;
    }
    if (::setenv(cfg.tokenEnvVar.c_str(), token.c_str(), 1) != 0) {
        LOG_WARN("Cannot export token to {}: {}", cfg.tokenEnvVar, std::strerror(errno));
        return;
    }
    LOG_DEBUG("Exported refreshed token to {}", cfg.tokenEnvVar);
}

std::string RelayApp::proxyUrl() const {
    const bool v6 = listenAddress.find(':') != std::string::npos;
    return fmt::format("http://{}{}{}:{}", v6 ? "[" : "", listenAddress, v6 ? "]" : "", server.boundPort());
}

std::string RelayApp::transcriptPath() const {
    return transcript && transcript->isOpen() ? transcript->path() : std::string();
}

void RelayApp::Start() {
    if (running) {
        return;
    }
    LOG_INFO("oauth-relay {} starting (mode: {})", relay::getVersionString(), cfg.oauth.mockMode ? "mock" : "oauth");

    auto first = tokens.GetToken();
    if (first.ok()) {
        LOG_INFO("Initial OAuth token ready");
    } else {
        LOG_WARN("Initial OAuth token fetch failed: {}", first.error->message);
        logger.Append(log::Severity::Warning, "Initial OAuth token fetch failed", first.error->message);
    }
    tokens.StartBackgroundRefresh(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.refreshInterval));

    try {
        server.Start().get();
    } catch (const std::exception&) {
        tokens.StopBackgroundRefresh();
        throw;
    }

    status::StatusInfo info;
    info.config = cfg.DisplayPairs();
    info.proxyUrl = proxyUrl();
    info.logFile = transcriptPath();
    info.startedAt = startedAt;
    status = std::make_unique<status::StatusAggregator>(tokens, logger, std::move(info));

    server.SetErrorHandler([this](const std::string& message) {
        LOG_WARN("{}", message);
        logger.Append(log::Severity::Error, "HTTP server error", message.substr(0, proxy::ForwardingProxy::kEventDetailLimit));
    });
    server.SetRequestHandler([this](const http::HttpRequest& req) { return Route(req); });
    running = true;
    LOG_INFO("Proxy server started on {}", proxyUrl());
    logger.Append(log::Severity::Info, "Proxy server started", fmt::format("Listening on {}", proxyUrl()));
}

http::HttpResponse RelayApp::Route(const http::HttpRequest& request) {
    const std::string path = stripQuery(request.target);
    if (request.method == "GET") {
        if (path == "/api/state" && status) {
            return http::HttpResponse{200, "application/json", status::StatusAggregator::ToJSON(status->Snapshot())};
        }
        return http::HttpResponse{404, "text/plain", "Not found"};
    }
    if (request.method == "POST") {
        return proxy.Handle(request);
    }
    return http::HttpResponse{405, "text/plain", "Method not allowed"};
}

void RelayApp::Stop() {
    if (!running) {
        return;
    }
    running = false;
    LOG_INFO("Relay shutting down");
    tokens.StopBackgroundRefresh();
    server.Stop().wait();

    const auto grace = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.shutdownGrace);
    if (!server.WaitForIdle(grace)) {
        LOG_WARN("{} request(s) still in flight after {}s; cancelling upstream calls",
                 server.activeConnections(), cfg.shutdownGrace.count());
        canceller.cancelAll();
        if (!server.WaitForIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kCancelWindow))) {
            LOG_WARN("{} connection(s) did not finish after cancellation", server.activeConnections());
        }
    }
    server.DetachHandler();
    LOG_INFO("Relay stopped");
}

} // namespace relay::app

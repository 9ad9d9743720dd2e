//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: oauth-relay executable (OAuth-injecting LLM proxy with status endpoint)
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "relay/app/RelayApp.hpp"
#include "relay/app/RelayConfig.hpp"
#include "relay/errors/Errors.h"
#include "relay/http/HttpServer.hpp"
#include "relay/version.h"

using namespace relay;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("RELAY_LOG_LEVEL", "INFO"));
    if (const std::string logFile = GetEnvOrDefault("RELAY_LOG_FILE", ""); !logFile.empty()) {
        Logger::setLogFile(logFile);
    }

    app::RelayConfig cfg;
    try {
        cfg = app::RelayConfig::FromEnvironment();
        if (auto v = getArgValue(argc, argv, "--listen"); v.has_value()) {
            (void)http::HttpServer::FromListenUrl(v.value());
            cfg.listenUrl = v.value();
        }
        if (auto v = getArgValue(argc, argv, "--log-dir"); v.has_value()) {
            cfg.logDir = v.value();
        }
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        std::cerr << "oauth-relay: invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    app::RelayApp relayApp(cfg);
    try {
        relayApp.Start();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start relay: {}", e.what());
        std::cerr << "oauth-relay: failed to start: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "oauth-relay " << getVersionString() << "\n"
              << "  Proxy:  " << relayApp.proxyUrl() << "\n"
              << "  Status: " << relayApp.proxyUrl() << "/api/state\n"
              << "  Mode:   " << (cfg.oauth.mockMode ? "mock" : "oauth") << "\n";
    if (!relayApp.transcriptPath().empty()) {
        std::cout << "  Log:    " << relayApp.transcriptPath() << "\n";
    }
    std::cout << "Press Ctrl+C to stop" << std::endl;

    boost::asio::io_context signalsIo;
    boost::asio::signal_set signals(signalsIo, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}", signo);
        }
    });
    signalsIo.run();

    relayApp.Stop();
    return 0;
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpServer.hpp
// Purpose: Plain HTTP/1.1 listener using Boost.Beast; one worker thread per accepted connection
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace relay::http {

// Inbound request as seen by the relay handlers.
struct HttpRequest {
    std::string method;
    std::string target;
    std::string contentType;
    std::string body;
};

struct HttpResponse {
    int status{200};
    std::string contentType{"application/json"};
    std::string body;
};

class HttpServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port and per-connection limits.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see boundPort())
    //   maxBodyBytes: Largest accepted request body
    //   ioTimeoutMs: Bound on reading the request and on writing the response
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8889"};
        std::size_t maxBodyBytes{32u * 1024u * 1024u};
        unsigned int ioTimeoutMs{30000};
    };

    using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // FromListenUrl
    // Purpose: Parses "http://<address>:<port>" (scheme optional, IPv6 as [addr]:port).
    // Throws:
    //   relay::errors::ConfigError for https, a missing host or a port that is not 0..65535.
    //==========================================================================================================
    static Options FromListenUrl(const std::string& url);

    explicit HttpServer(const Options& opts);
    ~HttpServer();

    //==========================================================================================================
    // Starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the socket is listening, or holds the bind failure.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops accepting: closes the acceptor and joins the I/O thread. Connections already handed to workers
    // keep being served.
    // Returns:
    //   Future that completes when the listener is down.
    //==========================================================================================================
    std::future<void> Stop();

    // Drops the request and error handlers, blocking until handlers already running return. Connections
    // that reach dispatch afterwards are answered with 503.
    void DetachHandler();

    // Waits until no worker is serving a connection. Returns false on timeout.
    bool WaitForIdle(std::chrono::milliseconds timeout);
    std::size_t activeConnections() const;

    // Port actually bound (useful with port "0"); 0 before Start() completes.
    unsigned short boundPort() const;

    void SetRequestHandler(RequestHandler handler);
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace relay::http

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/http/HttpServer.cpp
// Purpose: HTTP/1.1 listener using Boost.Beast (coroutine accept loop, worker thread per connection)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <stdexcept>
#include <algorithm>
#include <cctype>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "relay/errors/Errors.h"
#include "relay/http/HttpServer.hpp"
#include "relay/version.h"

namespace relay::http {
namespace net = boost::asio;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

// State shared between the listener and its detached workers; outlives the server object if a worker lags.
struct ServerState {
    HttpServer::Options opts;
    std::atomic<bool> running{false};

    std::shared_mutex handlerMtx;
    HttpServer::RequestHandler requestHandler;
    HttpServer::ErrorHandler errorHandler;

    std::mutex workersMtx;
    std::condition_variable workersCv;
    std::size_t activeWorkers{0};

    void setError(const std::string& msg) {
        std::shared_lock<std::shared_mutex> lk(handlerMtx);
        if (errorHandler) { errorHandler(msg); }
        else { LOG_WARN("{}", msg); }
    }

    HttpResponse dispatch(const HttpRequest& req) {
        std::shared_lock<std::shared_mutex> lk(handlerMtx);
        if (!requestHandler) {
            return HttpResponse{503, "text/plain", "Service shutting down"};
        }
        try {
            return requestHandler(req);
        } catch (const std::exception& e) {
            LOG_ERROR("HttpServer: request handler threw: {}", e.what());
            return HttpResponse{500, "text/plain", std::string("Internal server error: ") + e.what()};
        }
    }

    void workerStarted() {
        std::lock_guard<std::mutex> lk(workersMtx);
        activeWorkers += 1;
    }

    void workerDone() {
        {
            std::lock_guard<std::mutex> lk(workersMtx);
            activeWorkers -= 1;
        }
        workersCv.notify_all();
    }
};

net::awaitable<void> serveConnection(std::shared_ptr<ServerState> st, tcp::socket socket) {
    try {
        boost::beast::tcp_stream stream(std::move(socket));
        boost::beast::flat_buffer buffer;
        bhttp::request_parser<bhttp::string_body> parser;
        parser.body_limit(st->opts.maxBodyBytes);

        stream.expires_after(std::chrono::milliseconds(st->opts.ioTimeoutMs));
        co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);
        auto req = parser.release();

        HttpRequest in;
        in.method = std::string(req.method_string());
        in.target = std::string(req.target());
        in.contentType = std::string(req[bhttp::field::content_type]);
        in.body = std::move(req.body());
        LOG_DEBUG("HttpServer: {} {} ({} bytes)", in.method, in.target, in.body.size());

        // Handler runs synchronously; this io_context belongs to this connection alone.
        stream.expires_never();
        HttpResponse out = st->dispatch(in);

        bhttp::response<bhttp::string_body> res;
        res.version(req.version());
        res.result(static_cast<unsigned>(out.status));
        res.set(bhttp::field::server, std::string("oauth-relay/") + relay::getVersionString());
        res.set(bhttp::field::content_type, out.contentType);
        res.keep_alive(false);
        res.body() = std::move(out.body);
        res.prepare_payload();

        stream.expires_after(std::chrono::milliseconds(st->opts.ioTimeoutMs));
        co_await bhttp::async_write(stream, res, net::use_awaitable);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    } catch (const boost::system::system_error& e) {
        if (e.code() == bhttp::error::end_of_stream) {
            LOG_DEBUG("HttpServer: client closed connection before sending a request");
        } else if (!st->running.load()) {
            LOG_DEBUG("HttpServer session ended during shutdown: {}", e.what());
        } else {
            st->setError(std::string("HttpServer session error: ") + e.what());
        }
    } catch (const std::exception& e) {
        st->setError(std::string("HttpServer session error: ") + e.what());
    }
    co_return;
}

} // namespace

class HttpServer::Impl {
public:
    std::shared_ptr<ServerState> state;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::atomic<unsigned short> port{0};

    std::promise<void> ready;
    bool readySignalled{false};

    explicit Impl(const HttpServer::Options& o) : state(std::make_shared<ServerState>()) {
        state->opts = o;
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void signalReady(std::exception_ptr failure) {
        if (readySignalled) { return; }
        readySignalled = true;
        if (failure) { ready.set_exception(failure); }
        else { ready.set_value(); }
    }

    void acceptFailed(const std::string& what) {
        const std::string msg = std::string("HttpServer accept error: ") + what;
        if (!readySignalled) {
            LOG_ERROR("HttpServer: cannot listen on {}:{}: {}", state->opts.address, state->opts.port, what);
            signalReady(std::make_exception_ptr(std::runtime_error(msg)));
        } else if (!state->running.load()) {
            LOG_DEBUG("HttpServer accept loop ended during shutdown: {}", what);
        } else {
            state->setError(msg);
        }
    }

    void launchWorker(std::shared_ptr<net::io_context> workerCtx, tcp::socket socket) {
        auto st = state;
        net::co_spawn(*workerCtx, serveConnection(st, std::move(socket)), net::detached);
        st->workerStarted();
        try {
            std::thread([st, workerCtx]() {
                workerCtx->run();
                st->workerDone();
            }).detach();
        } catch (const std::system_error& e) {
            st->workerDone();
            st->setError(std::string("HttpServer: cannot start worker thread: ") + e.what());
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto r = resolver.resolve(state->opts.address, state->opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            port.store(acceptor->local_endpoint().port());
            LOG_INFO("HttpServer listening on {}:{}", state->opts.address, port.load());
            signalReady(nullptr);

            while (state->running.load()) {
                auto workerCtx = std::make_shared<net::io_context>();
                tcp::socket socket(*workerCtx);
                co_await acceptor->async_accept(socket, net::use_awaitable);
                launchWorker(workerCtx, std::move(socket));
            }
        } catch (const boost::system::system_error& e) {
            acceptFailed(e.what());
        } catch (const std::exception& e) {
            acceptFailed(e.what());
        }
        co_return;
    }
};

HttpServer::Options HttpServer::FromListenUrl(const std::string& url) {
    Options opts;
    std::string cfg = url;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "https://")) {
        throw errors::ConfigError("TLS listener is not supported: " + url);
    }
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    }

    std::string hostPort = cfg;
    auto slash = cfg.find('/');
    if (slash != std::string::npos) {
        hostPort = cfg.substr(0, slash);
    }
    trim(hostPort);
    if (hostPort.empty()) {
        throw errors::ConfigError("Listen URL has no host: " + url);
    }

    if (hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw errors::ConfigError("Listen URL has an unterminated IPv6 address: " + url);
        }
        opts.address = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            opts.port = hostPort.substr(rb + 2);
        }
    } else {
        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            opts.address = hostPort.substr(0, colon);
            opts.port = hostPort.substr(colon + 1);
        } else {
            opts.address = hostPort;
        }
    }
    trim(opts.address);
    trim(opts.port);
    if (opts.address.empty()) {
        throw errors::ConfigError("Listen URL has no host: " + url);
    }
    if (opts.port.empty()) {
        throw errors::ConfigError("Listen URL has no port: " + url);
    }
    bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
    if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
        throw errors::ConfigError("Listen URL has an invalid port: " + url);
    }
    return opts;
}

HttpServer::HttpServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HttpServer::~HttpServer() {
    Stop().wait();
    DetachHandler();
}

std::future<void> HttpServer::Start() {
    auto fut = pImpl->ready.get_future();
    pImpl->state->running.store(true);
    pImpl->ioThread = std::thread([this]() {
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
        pImpl->ioc.run();
    });
    return fut;
}

std::future<void> HttpServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->state->running.store(false);
    if (pImpl->ioThread.joinable()) {
        pImpl->ioc.stop();
        pImpl->ioThread.join();
        if (pImpl->acceptor) {
            boost::system::error_code ec; pImpl->acceptor->close(ec);
        }
        LOG_INFO("HttpServer stopped accepting connections");
    }
    done.set_value();
    return fut;
}

void HttpServer::DetachHandler() {
    std::unique_lock<std::shared_mutex> lk(pImpl->state->handlerMtx);
    pImpl->state->requestHandler = nullptr;
    pImpl->state->errorHandler = nullptr;
}

bool HttpServer::WaitForIdle(std::chrono::milliseconds timeout) {
    auto& st = *pImpl->state;
    std::unique_lock<std::mutex> lk(st.workersMtx);
    return st.workersCv.wait_for(lk, timeout, [&st]{ return st.activeWorkers == 0; });
}

std::size_t HttpServer::activeConnections() const {
    auto& st = *pImpl->state;
    std::lock_guard<std::mutex> lk(st.workersMtx);
    return st.activeWorkers;
}

unsigned short HttpServer::boundPort() const {
    return pImpl->port.load();
}

void HttpServer::SetRequestHandler(RequestHandler handler) {
    std::unique_lock<std::shared_mutex> lk(pImpl->state->handlerMtx);
    pImpl->state->requestHandler = std::move(handler);
}

void HttpServer::SetErrorHandler(ErrorHandler handler) {
    std::unique_lock<std::shared_mutex> lk(pImpl->state->handlerMtx);
    pImpl->state->errorHandler = std::move(handler);
}

} // namespace relay::http

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/http/HttpClient.cpp
// Purpose: Outbound HTTP/HTTPS POST using Boost.Beast coroutines (OAuth token and upstream completion calls)
//==========================================================================================================

#include <string>
#include <utility>
#include <memory>
#include <chrono>
#include <future>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "relay/http/HttpClient.hpp"
#include "relay/version.h"

namespace relay::http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct UrlParts { std::string scheme, host, port, path; };

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

std::string hostHeader(const UrlParts& u) {
    const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
    return defaultPort ? u.host : u.host + ":" + u.port;
}

void configureTrust(ssl::context& ctx, const HttpCallParams& params) {
    ::SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
    if (!params.caFile.empty() || !params.caPath.empty()) {
        if (!params.caFile.empty()) { ctx.load_verify_file(params.caFile); }
        if (!params.caPath.empty()) { ctx.add_verify_path(params.caPath); }
    } else {
        // set_default_verify_paths() would getenv() on this thread; use the cached lookup instead
        const auto& sys = SystemTrustPaths();
        bool loaded = false;
        if (!sys.file.empty() && ::SSL_CTX_load_verify_locations(ctx.native_handle(), sys.file.c_str(), nullptr) == 1) {
            loaded = true;
        }
        if (!sys.dir.empty() && ::SSL_CTX_load_verify_locations(ctx.native_handle(), nullptr, sys.dir.c_str()) == 1) {
            loaded = true;
        }
        ::ERR_clear_error();
        if (!loaded) {
            LOG_WARN("HTTPS: no system trust anchors loaded (file '{}', dir '{}')", sys.file, sys.dir);
        }
    }
    ctx.set_verify_mode(ssl::verify_peer);
}

bhttp::request<bhttp::string_body> buildRequest(const UrlParts& u, const HttpCallParams& params) {
    bhttp::request<bhttp::string_body> req{bhttp::verb::post, u.path, 11};
    req.set(bhttp::field::host, hostHeader(u));
    req.set(bhttp::field::content_type, params.contentType);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::user_agent, std::string("oauth-relay/") + relay::getVersionString());
    req.set(bhttp::field::connection, "close");
    for (const auto& h : params.headers) {
        req.set(h.name, h.value);
    }
    req.body() = params.body;
    req.prepare_payload();
    return req;
}

} // namespace

const TrustPaths& SystemTrustPaths() {
    static const TrustPaths paths = [] {
        TrustPaths p;
        p.file = GetEnvOrDefault(::X509_get_default_cert_file_env(), ::X509_get_default_cert_file());
        p.dir = GetEnvOrDefault(::X509_get_default_cert_dir_env(), ::X509_get_default_cert_dir());
        LOG_DEBUG("HTTPS: system trust file '{}', dir '{}'", p.file, p.dir);
        return p;
    }();
    return paths;
}

net::awaitable<HttpCallResult> coPost(HttpCallParams params) {
    HttpCallResult out;
    try {
        UrlParts u = parseUrl(params.url);
        if (u.host.empty()) {
            out.error = std::string("invalid URL: ") + params.url;
            co_return out;
        }
        if (u.scheme != "http" && u.scheme != "https") {
            out.error = std::string("unsupported URL scheme: ") + u.scheme;
            co_return out;
        }
        auto executor = co_await net::this_coro::executor;
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        LOG_DEBUG("HTTP client resolved {}:{} path={}", u.host, u.port, u.path);

        auto req = buildRequest(u, params);
        bhttp::response_parser<bhttp::string_body> parser;
        parser.body_limit(params.maxResponseBytes);
        boost::beast::flat_buffer buffer;

        if (u.scheme == std::string("https")) {
            ssl::context ctx(ssl::context::tls_client);
            configureTrust(ctx, params);
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, ctx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI hostname {}", u.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());

            stream.next_layer().expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            stream.next_layer().expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await bhttp::async_write(stream, req, net::use_awaitable);
            co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);

            boost::system::error_code ec;
            stream.next_layer().expires_after(std::chrono::seconds(2));
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } else {
            boost::beast::tcp_stream stream(executor);
            stream.expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            stream.expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await bhttp::async_write(stream, req, net::use_awaitable);
            co_await bhttp::async_read(stream, buffer, parser, net::use_awaitable);

            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        auto res = parser.release();
        out.completed = true;
        out.status = static_cast<int>(res.result_int());
        out.body = std::move(res.body());
        LOG_DEBUG("HTTP client {} -> status={} bytes={}", params.url, out.status, out.body.size());
    } catch (const boost::system::system_error& e) {
        out.timedOut = (e.code() == boost::beast::error::timeout);
        out.error = out.timedOut ? std::string("timed out") : e.code().message();
    } catch (const std::exception& e) {
        out.error = e.what();
    }
    co_return out;
}

HttpCallResult PostSync(const HttpCallParams& params, CallCanceller* canceller) {
    net::io_context ioc;
    if (canceller != nullptr && !canceller->attach(ioc)) {
        HttpCallResult r;
        r.cancelled = true;
        r.error = "call cancelled before start";
        return r;
    }
    auto fut = net::co_spawn(ioc, coPost(params), net::use_future);
    ioc.run();
    if (canceller != nullptr) {
        canceller->detach(ioc);
    }
    if (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        // io_context was stopped underneath the call
        HttpCallResult r;
        r.cancelled = true;
        r.error = "call cancelled";
        return r;
    }
    try {
        return fut.get();
    } catch (const std::exception& e) {
        HttpCallResult r;
        r.error = e.what();
        return r;
    }
}

bool CallCanceller::attach(net::io_context& ioc) {
    std::lock_guard<std::mutex> lk(mtx);
    if (triggered) {
        return false;
    }
    active.insert(&ioc);
    return true;
}

void CallCanceller::detach(net::io_context& ioc) {
    std::lock_guard<std::mutex> lk(mtx);
    active.erase(&ioc);
}

void CallCanceller::cancelAll() {
    std::lock_guard<std::mutex> lk(mtx);
    triggered = true;
    for (auto* ioc : active) {
        ioc->stop();
    }
}

bool CallCanceller::cancelled() const {
    std::lock_guard<std::mutex> lk(mtx);
    return triggered;
}

} // namespace relay::http

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_client.cpp
// Purpose: GoogleTests for the outbound POST helper (status passthrough, timeouts, cancellation)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <future>
#include <string>
#include <thread>

#include "relay/http/HttpClient.hpp"
#include "support/StubHttpServer.hpp"

using namespace relay::http;
using relaytest::StubHttpServer;
using relaytest::StubRequest;
using relaytest::StubResponse;

TEST(HttpClient, PostsBodyAndHeaders) {
    StubHttpServer srv([](const StubRequest& r) {
        return StubResponse{418, "application/json", std::string("{\"echo\":") + r.body + "}"};
    });
    srv.start();

    HttpCallParams p;
    p.url = srv.url("/v1/chat/completions");
    p.body = "{\"q\":1}";
    p.headers.push_back(HeaderKV{"Authorization", "Bearer abc"});
    auto r = PostSync(p);

    EXPECT_TRUE(r.completed);
    EXPECT_EQ(r.status, 418);
    EXPECT_EQ(r.body, "{\"echo\":{\"q\":1}}");
    auto seen = srv.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].method, "POST");
    EXPECT_EQ(seen[0].target, "/v1/chat/completions");
    EXPECT_EQ(seen[0].contentType, "application/json");
    EXPECT_EQ(seen[0].authorization, "Bearer abc");
    srv.stop();
}

TEST(HttpClient, ReadTimeoutIsReported) {
    StubHttpServer srv([](const StubRequest&) {
        StubResponse r{200, "application/json", "{}"};
        r.delay = std::chrono::milliseconds(2000);
        return r;
    });
    srv.start();
    HttpCallParams p;
    p.url = srv.url("/slow");
    p.readTimeoutMs = 200;
    auto r = PostSync(p);
    EXPECT_FALSE(r.completed);
    EXPECT_TRUE(r.timedOut);
    EXPECT_FALSE(r.cancelled);
    srv.stop();
}

TEST(HttpClient, ConnectionRefusedIsAnError) {
    HttpCallParams p;
    p.url = std::string("http://127.0.0.1:") + std::to_string(relaytest::UnusedPort()) + "/";
    auto r = PostSync(p);
    EXPECT_FALSE(r.completed);
    EXPECT_FALSE(r.timedOut);
    EXPECT_FALSE(r.error.empty());
}

TEST(HttpClient, UnsupportedSchemeIsAnError) {
    HttpCallParams p;
    p.url = "ftp://127.0.0.1/file";
    auto r = PostSync(p);
    EXPECT_FALSE(r.completed);
    EXPECT_NE(r.error.find("unsupported URL scheme"), std::string::npos);
}

TEST(HttpClient, CancellerStopsInFlightAndLateCalls) {
    StubHttpServer srv([](const StubRequest&) {
        StubResponse r{200, "application/json", "{}"};
        r.delay = std::chrono::milliseconds(3000);
        return r;
    });
    srv.start();
    CallCanceller canceller;
    HttpCallParams p;
    p.url = srv.url("/slow");

    auto pending = std::async(std::launch::async, [&]() { return PostSync(p, &canceller); });
    while (srv.hits() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    const auto started = std::chrono::steady_clock::now();
    canceller.cancelAll();
    auto r = pending.get();
    EXPECT_TRUE(r.cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1500));
    EXPECT_TRUE(canceller.cancelled());

    auto late = PostSync(p, &canceller);
    EXPECT_TRUE(late.cancelled);
    EXPECT_EQ(srv.hits(), 1);
    srv.stop();
}

TEST(HttpClient, SystemTrustPathsAreResolvedOnce) {
    const TrustPaths& first = SystemTrustPaths();
    const std::string file = first.file;
    const std::string dir = first.dir;
    EXPECT_FALSE(file.empty() && dir.empty());

    const char* prev = std::getenv("SSL_CERT_FILE");
    const std::string saved = prev ? prev : "";
    ::setenv("SSL_CERT_FILE", "/nonexistent/changed-after-start.pem", 1);
    const TrustPaths& second = SystemTrustPaths();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.file, file);
    EXPECT_EQ(second.dir, dir);
    if (prev) { ::setenv("SSL_CERT_FILE", saved.c_str(), 1); } else { ::unsetenv("SSL_CERT_FILE"); }
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/http/HttpClient.hpp
// Purpose: Single-shot outbound HTTP/HTTPS POST with timeouts and cooperative cancellation
//==========================================================================================================
#pragma once

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

namespace relay::http {

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// HttpCallParams
// Purpose: Everything needed for one outbound POST.
// Fields:
//   url: Absolute http:// or https:// URL (scheme defaults to http when omitted).
//   contentType/body: Request payload, sent verbatim.
//   headers: Extra request headers (e.g., Authorization).
//   caFile/caPath: Optional trust anchors for https; system defaults are used when both are empty.
//   connectTimeoutMs: Bound on TCP connect plus TLS handshake.
//   readTimeoutMs: Bound on writing the request and reading the full response.
//   maxResponseBytes: Response body limit.
//==========================================================================================================
struct HttpCallParams {
    std::string url;
    std::string contentType{"application/json"};
    std::string body;
    std::vector<HeaderKV> headers;
    std::string caFile;
    std::string caPath;
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
    std::size_t maxResponseBytes{64u * 1024u * 1024u};
};

//==========================================================================================================
// HttpCallResult
// Purpose: Outcome of one POST. 'completed' is true whenever an HTTP response was read, whatever its status.
//==========================================================================================================
struct HttpCallResult {
    bool completed{false};
    int status{0};
    std::string body;
    std::string error;
    bool timedOut{false};
    bool cancelled{false};
};

//==========================================================================================================
// CallCanceller
// Purpose: Registry of in-flight synchronous calls that can be aborted together (used at shutdown).
// Notes:
//   - attach() fails once cancelAll() has been called, so late calls never start.
//==========================================================================================================
class CallCanceller {
public:
    bool attach(boost::asio::io_context& ioc);
    void detach(boost::asio::io_context& ioc);
    void cancelAll();
    bool cancelled() const;

private:
    mutable std::mutex mtx;
    std::unordered_set<boost::asio::io_context*> active;
    bool triggered{false};
};

//==========================================================================================================
// TrustPaths / SystemTrustPaths
// Purpose: OpenSSL's default CA bundle and directory, with SSL_CERT_FILE/SSL_CERT_DIR applied.
// Notes:
//   - Resolved on the first call and cached; later environment changes are not seen.
//   - Call once from the main thread before other threads may modify the environment.
//==========================================================================================================
struct TrustPaths {
    std::string file;
    std::string dir;
};
const TrustPaths& SystemTrustPaths();

// Coroutine form; never throws, failures are reported in the result.
boost::asio::awaitable<HttpCallResult> coPost(HttpCallParams params);

//==========================================================================================================
// PostSync
// Purpose: Runs coPost on a private io_context and blocks the calling thread until it finishes.
// Args:
//   params: Request description.
//   canceller: Optional registry; when it fires the call returns with cancelled=true.
//==========================================================================================================
HttpCallResult PostSync(const HttpCallParams& params, CallCanceller* canceller = nullptr);

} // namespace relay::http

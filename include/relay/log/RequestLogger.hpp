//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/log/RequestLogger.hpp
// Purpose: Bounded in-memory event ring and proxied-request ring shared by the proxy and the status view
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relay::log {

using TimePoint = std::chrono::system_clock::time_point;

enum class Severity { Info, Success, Warning, Error };

// Lowercase name used in the status document ("info", "success", "warning", "error").
const char* severityName(Severity s);

//==========================================================================================================
// LogEntry
// Purpose: One dashboard event. Never mutated after it is appended.
//==========================================================================================================
struct LogEntry {
    TimePoint timestamp{};
    Severity severity{Severity::Info};
    std::string message;
    std::optional<std::string> details;
};

//==========================================================================================================
// ProxyRequest
// Purpose: What the proxy learned about one accepted inbound completion request.
// Fields:
//   id: Assigned by the proxy; strictly increasing, starting at 1.
//   maxTokens: Present only when the caller sent a numeric max_tokens.
//   rawBody: Inbound body exactly as received.
//==========================================================================================================
struct ProxyRequest {
    std::uint64_t id{0};
    TimePoint receivedAt{};
    std::string model;
    std::size_t messageCount{0};
    std::optional<std::int64_t> maxTokens;
    std::string rawBody;
};

struct OutcomeSuccess {
    std::string finishReason;
    std::int64_t totalTokens{0};
    std::chrono::duration<double> elapsed{0.0};
};

struct OutcomeUpstreamError {
    int statusCode{0};
    std::string message;
};

struct OutcomeTransportError {
    std::string message;
    bool timedOut{false};
};

struct OutcomeAuthError {
    std::string message;
};

using ProxyOutcome = std::variant<OutcomeSuccess, OutcomeUpstreamError, OutcomeTransportError, OutcomeAuthError>;

struct RequestRecord {
    ProxyRequest request;
    std::optional<ProxyOutcome> outcome;
};

struct LoggerCounters {
    std::uint64_t requests{0};
    std::uint64_t responses{0};
    std::uint64_t errors{0};
    std::optional<TimePoint> lastRequest;
    std::optional<TimePoint> lastResponse;
};

//==========================================================================================================
// RequestLogger
// Purpose: Thread-safe rings of recent events and recent requests plus running counters.
// Notes:
//   - Both rings evict their oldest element once full.
//   - Snapshots are copies ordered most-recent-first.
//   - Counters keep counting after the matching record has been evicted from the ring.
//==========================================================================================================
class RequestLogger {
public:
    using Clock = std::function<TimePoint()>;

    static constexpr std::size_t kDefaultEventCapacity = 100;
    static constexpr std::size_t kDefaultRequestCapacity = 50;

    explicit RequestLogger(std::size_t eventCapacity = kDefaultEventCapacity,
                           std::size_t requestCapacity = kDefaultRequestCapacity,
                           Clock clock = Clock());

    void Append(LogEntry entry);
    // Stamps the entry with the logger clock.
    void Append(Severity severity, std::string message, std::optional<std::string> details = std::nullopt);
    std::vector<LogEntry> Snapshot() const;

    void RecordRequest(ProxyRequest request);

    //======================================================================================================
    // SetOutcome
    // Purpose: Attaches the final outcome of request 'id' and updates the counters.
    // Returns:
    //   true when the outcome was attached to a record still held in the ring; false when the id was never
    //   recorded, was already resolved, or has been evicted (counters are still updated in that last case).
    //======================================================================================================
    bool SetOutcome(std::uint64_t id, ProxyOutcome outcome);

    // Counts an inbound request rejected before an id was assigned (malformed JSON).
    void RecordRejected();

    std::vector<RequestRecord> RequestsSnapshot() const;
    LoggerCounters Counters() const;

    std::size_t eventCapacity() const { return maxEvents; }
    std::size_t requestCapacity() const { return maxRequests; }

private:
    TimePoint now() const;

    const std::size_t maxEvents;
    const std::size_t maxRequests;
    Clock clock;

    mutable std::mutex eventsMtx;
    std::deque<LogEntry> events;

    mutable std::mutex requestsMtx;
    std::deque<RequestRecord> requests;
    std::uint64_t highestRecordedId{0};
    LoggerCounters counters;
};

} // namespace relay::log

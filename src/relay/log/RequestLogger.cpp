//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/log/RequestLogger.cpp
// Purpose: Bounded event and request rings
//==========================================================================================================

#include <algorithm>
#include <utility>

#include "relay/log/RequestLogger.hpp"

namespace relay::log {

const char* severityName(Severity s) {
    switch (s) {
        case Severity::Info: return "info";
        case Severity::Success: return "success";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "info";
}

RequestLogger::RequestLogger(std::size_t eventCapacity, std::size_t requestCapacity, Clock clk)
    : maxEvents(std::max<std::size_t>(eventCapacity, 1)),
      maxRequests(std::max<std::size_t>(requestCapacity, 1)),
      clock(std::move(clk)) {}

TimePoint RequestLogger::now() const {
    return clock ? clock() : std::chrono::system_clock::now();
}

void RequestLogger::Append(LogEntry entry) {
    std::lock_guard<std::mutex> lk(eventsMtx);
    events.push_back(std::move(entry));
    while (events.size() > maxEvents) {
        events.pop_front();
    }
}

void RequestLogger::Append(Severity severity, std::string message, std::optional<std::string> details) {
    LogEntry entry;
    entry.timestamp = now();
    entry.severity = severity;
    entry.message = std::move(message);
    entry.details = std::move(details);
    Append(std::move(entry));
}

std::vector<LogEntry> RequestLogger::Snapshot() const {
    std::lock_guard<std::mutex> lk(eventsMtx);
    return std::vector<LogEntry>(events.rbegin(), events.rend());
}

void RequestLogger::RecordRequest(ProxyRequest request) {
    std::lock_guard<std::mutex> lk(requestsMtx);
    counters.requests += 1;
    counters.lastRequest = request.receivedAt;
    highestRecordedId = std::max(highestRecordedId, request.id);
    requests.push_back(RequestRecord{std::move(request), std::nullopt});
    while (requests.size() > maxRequests) {
        requests.pop_front();
    }
}

bool RequestLogger::SetOutcome(std::uint64_t id, ProxyOutcome outcome) {
    const TimePoint at = now();
    std::lock_guard<std::mutex> lk(requestsMtx);
    if (id == 0 || id > highestRecordedId) {
        return false;
    }
    auto it = std::find_if(requests.begin(), requests.end(),
                           [id](const RequestRecord& r) { return r.request.id == id; });
    if (it != requests.end() && it->outcome.has_value()) {
        return false;
    }
    if (std::holds_alternative<OutcomeSuccess>(outcome)) {
        counters.responses += 1;
        counters.lastResponse = at;
    } else {
        counters.errors += 1;
    }
    if (it == requests.end()) {
        return false;
    }
    it->outcome = std::move(outcome);
    return true;
}

void RequestLogger::RecordRejected() {
    std::lock_guard<std::mutex> lk(requestsMtx);
    counters.errors += 1;
}

std::vector<RequestRecord> RequestLogger::RequestsSnapshot() const {
    std::lock_guard<std::mutex> lk(requestsMtx);
    return std::vector<RequestRecord>(requests.rbegin(), requests.rend());
}

LoggerCounters RequestLogger::Counters() const {
    std::lock_guard<std::mutex> lk(requestsMtx);
    return counters;
}

} // namespace relay::log

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/status/StatusAggregator.hpp
// Purpose: Point-in-time relay status combining token state with the request logger
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "relay/log/RequestLogger.hpp"
#include "relay/token/TokenManager.hpp"

namespace relay::status {

//==========================================================================================================
// StatusInfo
// Purpose: Static facts about the running relay, fixed at startup.
// Fields:
//   config: Display-safe configuration pairs (secrets already removed).
//   proxyUrl: URL clients should use to reach the relay.
//   logFile: Transcript path ("" when disabled).
//   startedAt: Process start instant used for uptime.
//==========================================================================================================
struct StatusInfo {
    std::vector<std::pair<std::string, std::string>> config;
    std::string proxyUrl;
    std::string logFile;
    log::TimePoint startedAt{};
};

struct StatusSnapshot {
    std::string version;
    log::TimePoint takenAt{};
    std::chrono::seconds uptime{0};
    token::TokenStatus token;
    std::vector<log::LogEntry> events;
    std::vector<log::RequestRecord> requests;
    log::LoggerCounters counters;
    StatusInfo info;
};

class StatusAggregator {
public:
    StatusAggregator(const token::TokenManager& tokens,
                     const log::RequestLogger& logger,
                     StatusInfo info,
                     std::function<log::TimePoint()> clock = std::function<log::TimePoint()>());

    // Each source is copied under its own lock; no two locks are held at once.
    StatusSnapshot Snapshot() const;

    // JSON document served at GET /api/state.
    static std::string ToJSON(const StatusSnapshot& snapshot);

    // Local time as "YYYY-mm-ddTHH:MM:SS.mmm".
    static std::string FormatTimestamp(log::TimePoint at);

private:
    const token::TokenManager& tokens;
    const log::RequestLogger& logger;
    const StatusInfo info;
    std::function<log::TimePoint()> clock;
};

} // namespace relay::status

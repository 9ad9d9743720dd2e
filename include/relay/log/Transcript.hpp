//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/log/Transcript.hpp
// Purpose: Append-only human-readable transcript of proxied requests, responses and errors
//==========================================================================================================
#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "relay/log/RequestLogger.hpp"

namespace relay::log {

//==========================================================================================================
// Transcript
// Purpose: One file per relay process. Each block starts with a header line and an 80-character rule.
// Notes:
//   - When the file cannot be opened the transcript stays disabled and every write is a no-op.
//==========================================================================================================
class Transcript {
public:
    explicit Transcript(std::string filePath);

    // "relay_requests_YYYYmmdd_HHMMSS.log" for the given instant (local time).
    static std::string FileNameFor(TimePoint at);

    const std::string& path() const { return filePath; }
    bool isOpen() const;

    void WriteRequest(const ProxyRequest& request);
    void WriteResponse(std::uint64_t id, const OutcomeSuccess& outcome, const std::string& body);
    void WriteError(std::uint64_t id, const std::string& message);
    void WriteWarning(std::uint64_t id, const std::string& message);

private:
    void write(const std::string& block);

    std::string filePath;
    mutable std::mutex mtx;
    std::ofstream out;
};

} // namespace relay::log

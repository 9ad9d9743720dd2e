//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/log/Transcript.cpp
// Purpose: Transcript file formatting
//==========================================================================================================

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "relay/log/Transcript.hpp"

namespace relay::log {

namespace {

constexpr std::size_t kResponseBodyLimit = 2000;

std::string rule() { return std::string(80, '='); }

std::string clockTime(TimePoint at) {
    return fmt::format("{:%H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(at)));
}

} // namespace

Transcript::Transcript(std::string path) : filePath(std::move(path)) {
    std::error_code ec;
    const auto parent = std::filesystem::path(filePath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_WARN("Transcript: cannot create directory {}: {}", parent.string(), ec.message());
        }
    }
    out.open(filePath, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("Transcript: cannot open {}; request transcript disabled", filePath);
    } else {
        LOG_INFO("Transcript: logging proxied requests to {}", filePath);
    }
}

std::string Transcript::FileNameFor(TimePoint at) {
    return fmt::format("relay_requests_{:%Y%m%d_%H%M%S}.log",
                       fmt::localtime(std::chrono::system_clock::to_time_t(at)));
}

bool Transcript::isOpen() const {
    std::lock_guard<std::mutex> lk(mtx);
    return out.is_open();
}

void Transcript::write(const std::string& block) {
    std::lock_guard<std::mutex> lk(mtx);
    if (!out.is_open()) {
        return;
    }
    out << block << '\n';
    out.flush();
}

void Transcript::WriteRequest(const ProxyRequest& request) {
    const std::string maxTokens = request.maxTokens ? std::to_string(*request.maxTokens) : std::string("not set");
    write(fmt::format("\n{0}\nREQUEST #{1} at {2}\n{0}\nModel: {3}\nMax Tokens: {4}\nMessages: {5}\n\nFull Request:\n{6}\n",
                      rule(), request.id, clockTime(request.receivedAt), request.model, maxTokens,
                      request.messageCount, request.rawBody));
}

void Transcript::WriteResponse(std::uint64_t id, const OutcomeSuccess& outcome, const std::string& body) {
    const bool truncated = body.size() > kResponseBodyLimit;
    write(fmt::format("\nRESPONSE #{0} at {1} (took {2:.2f}s)\n{3}\nFinish Reason: {4}\nTotal Tokens: {5}\n\nFull Response:\n{6}{7}\n",
                      id, clockTime(std::chrono::system_clock::now()), outcome.elapsed.count(), rule(),
                      outcome.finishReason, outcome.totalTokens, body.substr(0, kResponseBodyLimit),
                      truncated ? "\n..." : ""));
}

void Transcript::WriteError(std::uint64_t id, const std::string& message) {
    const std::string label = id == 0 ? std::string("(rejected)") : fmt::format("#{}", id);
    write(fmt::format("\nERROR {} at {}\n{}\n{}\n", label, clockTime(std::chrono::system_clock::now()), rule(), message));
}

void Transcript::WriteWarning(std::uint64_t id, const std::string& message) {
    write(fmt::format("\nWARNING #{} at {}\n{}\n", id, clockTime(std::chrono::system_clock::now()), message));
}

} // namespace relay::log

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_transcript.cpp
// Purpose: GoogleTests for the request transcript file
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "relay/log/Transcript.hpp"

using namespace relay::log;

namespace {

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::filesystem::path scratchDir() {
    return std::filesystem::temp_directory_path() /
           ("relay_transcript_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
}

} // namespace

TEST(Transcript, FileNameCarriesTimestamp) {
    const std::string name = Transcript::FileNameFor(std::chrono::system_clock::now());
    EXPECT_EQ(name.rfind("relay_requests_", 0), 0u);
    EXPECT_EQ(name.size(), std::string("relay_requests_YYYYmmdd_HHMMSS.log").size());
    EXPECT_EQ(name.substr(name.size() - 4), ".log");
}

TEST(Transcript, WritesRequestResponseAndErrorBlocks) {
    const auto dir = scratchDir();
    const auto path = (dir / "nested" / "t.log").string();
    {
        Transcript t(path);
        ASSERT_TRUE(t.isOpen());

        ProxyRequest r;
        r.id = 3;
        r.receivedAt = std::chrono::system_clock::now();
        r.model = "gpt-x";
        r.messageCount = 2;
        r.rawBody = "{\"model\":\"gpt-x\"}";
        t.WriteRequest(r);
        t.WriteResponse(3, OutcomeSuccess{"stop", 10, std::chrono::duration<double>(0.25)}, std::string(2500, 'r'));
        t.WriteError(0, "Invalid JSON: unexpected end");
        t.WriteWarning(3, "WARNING: Response #3 was cut off (finish_reason=length)");
    }
    const std::string text = readAll(path);
    EXPECT_NE(text.find("REQUEST #3"), std::string::npos);
    EXPECT_NE(text.find("Max Tokens: not set"), std::string::npos);
    EXPECT_NE(text.find("{\"model\":\"gpt-x\"}"), std::string::npos);
    EXPECT_NE(text.find("RESPONSE #3"), std::string::npos);
    EXPECT_NE(text.find("(took 0.25s)"), std::string::npos);
    EXPECT_NE(text.find(std::string(2000, 'r') + "\n..."), std::string::npos);
    EXPECT_EQ(text.find(std::string(2001, 'r')), std::string::npos);
    EXPECT_NE(text.find("ERROR (rejected)"), std::string::npos);
    EXPECT_NE(text.find("WARNING #3"), std::string::npos);
    EXPECT_NE(text.find(std::string(80, '=')), std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(Transcript, UnwritablePathDisablesQuietly) {
    Transcript t("/proc/relay-cannot-write-here/t.log");
    EXPECT_FALSE(t.isOpen());
    ProxyRequest r;
    r.id = 1;
    t.WriteRequest(r);
    t.WriteError(1, "ignored");
}

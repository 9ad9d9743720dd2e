//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks (console, optional mirror file) and static state.
//==========================================================================================================

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

bool envFlag(const char* name, const char* defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue);
    return v == "1" || v == "true" || v == "TRUE";
}

// Read during static initialization, before any thread can setenv(); RELAY_LOG_COLOR colors the label only
const bool colorEnabled = envFlag("RELAY_LOG_COLOR", "1");
// stdout stays free for the startup banner when RELAY_LOG_STDERR=1
const bool useStderr = envFlag("RELAY_LOG_STDERR", "0");

} // namespace

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    const std::time_t nowTime = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    const char* reset = colorEnabled ? "\033[0m" : "";
    const char* labelColor = "";
    if (colorEnabled) {
        if (::strncmp(level, "ERROR", 5) == 0) {
            labelColor = "\033[38;5;88m"; // burgundy
        } else if (::strncmp(level, "WARN", 4) == 0) {
            labelColor = "\033[33m";
        } else {
            labelColor = "\033[35m";
        }
    }

    std::ostringstream oss;
    oss << "[" << labelColor << level << reset << "] " << file << ":" << line << ": " << msg << '\n';
    const std::string logMessage = oss.str();

    if (useStderr) {
        std::cerr << logMessage << std::flush;
    } else {
        std::cout << logMessage << std::flush;
    }
    if (sLogFile.is_open()) {
        sLogFile << logMessage;
        sLogFile.flush();
    }
}

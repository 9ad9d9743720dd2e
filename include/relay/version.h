//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Relay version reported in the startup banner, the User-Agent header and the status document.
//==========================================================================================================
#pragma once

#include <string>

namespace relay {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// Formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

} // namespace relay

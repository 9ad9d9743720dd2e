//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Relay version helpers.
//==========================================================================================================
#include "relay/version.h"

#include <fmt/format.h>

namespace relay {

VersionInfo getVersion() {
    return VersionInfo{1, 2, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace relay

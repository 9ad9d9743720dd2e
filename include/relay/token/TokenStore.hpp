//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/token/TokenStore.hpp
// Purpose: Cached OAuth credential with a synchronized accessor
//==========================================================================================================
#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace relay::token {

using TimePoint = std::chrono::system_clock::time_point;

//==========================================================================================================
// Credential
// Purpose: An access token and its lifetime. expiresAt already has the refresh safety margin applied.
//==========================================================================================================
struct Credential {
    std::string token;
    TimePoint obtainedAt{};
    TimePoint expiresAt{};

    bool IsValidAt(TimePoint now) const { return !token.empty() && now < expiresAt; }
};

//==========================================================================================================
// TokenStore
// Purpose: Holds at most one Credential. Readers always receive a copy; refreshes replace it wholesale.
//==========================================================================================================
class TokenStore {
public:
    std::optional<Credential> Get() const;
    void Replace(Credential credential);
    void Clear();

private:
    mutable std::mutex mtx;
    std::optional<Credential> current;
};

} // namespace relay::token

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/relay/token/TokenStore.cpp
// Purpose: TokenStore accessors
//==========================================================================================================

#include <utility>

#include "relay/token/TokenStore.hpp"

namespace relay::token {

std::optional<Credential> TokenStore::Get() const {
    std::lock_guard<std::mutex> lk(mtx);
    return current;
}

void TokenStore::Replace(Credential credential) {
    std::lock_guard<std::mutex> lk(mtx);
    current = std::move(credential);
}

void TokenStore::Clear() {
    std::lock_guard<std::mutex> lk(mtx);
    current.reset();
}

} // namespace relay::token

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/relay/token/ITokenSource.hpp
// Purpose: Bearer credential provider interface consumed by the forwarding proxy
//==========================================================================================================
#pragma once

#include <optional>

#include "relay/errors/Errors.h"
#include "relay/token/TokenStore.hpp"

namespace relay::token {

// Either a credential or the AuthFailure that prevented obtaining one.
struct TokenResult {
    std::optional<Credential> credential;
    std::optional<errors::RelayError> error;

    bool ok() const { return credential.has_value(); }
};

class ITokenSource {
public:
    virtual ~ITokenSource() = default;

    // Returns a credential valid at the time of the call, or an AuthFailure. May block on the network.
    virtual TokenResult GetToken() = 0;
};

} // namespace relay::token

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Builder for HTTP WWW-Authenticate challenges (Basic per RFC 7617, Bearer per RFC 6750)
//==========================================================================================================

#pragma once

#include <string>
#include <unordered_map>

namespace authgate::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: A single WWW-Authenticate challenge: scheme plus auth-params.
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;                                          // "basic" or "bearer", any case
    std::unordered_map<std::string, std::string> params;         // key -> raw value, quoted on output
};

//==========================================================================================================
// buildWwwAuthenticate
// Purpose: Formats a challenge. The scheme is emitted in canonical case ("Basic", "Bearer"); parameter
//          values are always quoted with '"' and '\' escaped. "realm" is written first when present.
//==========================================================================================================
std::string buildWwwAuthenticate(const WwwAuthChallenge& challenge);

} // namespace authgate::auth

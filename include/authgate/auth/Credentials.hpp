//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Credentials.hpp
// Purpose: Raw (parsed, not yet verified) credential types
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

namespace authgate::auth {

struct ApiKeyValue {
    std::string value;
};

//==========================================================================================================
// BasicAuthPair
// Purpose: Username and optional password decoded from an "Authorization: Basic" header.
//          password is std::nullopt when the decoded text had no ':' separator.
//==========================================================================================================
struct BasicAuthPair {
    std::string username;
    std::optional<std::string> password;
};

struct BearerTokenValue {
    std::string value;
};

using RawCredential = std::variant<ApiKeyValue, BasicAuthPair, BearerTokenValue>;

// Keeps at most the first four characters of a secret and masks the rest, e.g. "abcd***".
std::string maskSecret(const std::string& secret);

// Log-safe rendering of a credential; secrets are masked.
std::string describe(const BasicAuthPair& pair);
std::string describe(const RawCredential& credential);

} // namespace authgate::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialExtractors.hpp
// Purpose: Pure parsers turning request headers into candidate credentials
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http/fields.hpp>

#include "authgate/auth/Credentials.hpp"
#include "authgate/errors/AuthError.h"

namespace authgate::auth {

using HeaderFields = boost::beast::http::fields;

// Default name of the API key header.
inline constexpr const char* kDefaultApiKeyHeader = "x-api-key";

// True when every byte is visible ASCII (0x20-0x7E) or horizontal tab.
bool isHeaderText(std::string_view value);

//==========================================================================================================
// extractApiKey
// Purpose: Reads the API key from the configured header.
// Args:
//   headers: Request headers.
//   headerName: Header carrying the key (matched case-insensitively).
// Returns:
//   ApiKeyValue, or MissingCredential (absent header) / MalformedCredential (non-text bytes).
//==========================================================================================================
errors::AuthResult<ApiKeyValue> extractApiKey(const HeaderFields& headers, std::string_view headerName = kDefaultApiKeyHeader);

//==========================================================================================================
// extractBasicAuth
// Purpose: Parses "Authorization: Basic <base64(user[:password])>". The scheme token must be exactly
//          "Basic" followed by a single space; the payload must be canonical padded base64 of UTF-8
//          text. The text is split on the first ':'; without one the password is absent.
// Returns:
//   BasicAuthPair, or MissingCredential / MalformedCredential / DecodeFailure.
//==========================================================================================================
errors::AuthResult<BasicAuthPair> extractBasicAuth(const HeaderFields& headers);

//==========================================================================================================
// extractBearerToken
// Purpose: Parses "Authorization: Bearer <token>". The token is not validated here.
// Returns:
//   BearerTokenValue, or MissingCredential / MalformedCredential (wrong scheme or empty token).
//==========================================================================================================
errors::AuthResult<BearerTokenValue> extractBearerToken(const HeaderFields& headers);

//==========================================================================================================
// optionalCredential
// Purpose: Non-rejecting form of any extraction or authorization result: the value on success,
//          std::nullopt otherwise.
//==========================================================================================================
template <typename T>
std::optional<T> optionalCredential(errors::AuthResult<T> result) {
    if (!result.ok()) {
        return std::nullopt;
    }
    return std::optional<T>(std::move(result).value());
}

} // namespace authgate::auth

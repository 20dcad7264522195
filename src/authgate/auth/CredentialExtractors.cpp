//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/CredentialExtractors.cpp
// Purpose: API key, Basic and Bearer credential extraction from request headers
//==========================================================================================================

#include <string>

#include "authgate/auth/CredentialExtractors.hpp"
#include "authgate/auth/Base64.hpp"
#include "logging/Logger.h"

namespace authgate::auth {

using errors::AuthResult;
using errors::AuthScheme;

namespace {
    // Reads Authorization as text or reports the failure for the given scheme.
    AuthResult<std::string> readAuthorization(const HeaderFields& headers, AuthScheme scheme) {
        auto it = headers.find(boost::beast::http::field::authorization);
        if (it == headers.end()) {
            return errors::missingCredential(scheme, "Authorization header not found");
        }
        std::string_view value(it->value().data(), it->value().size());
        if (!isHeaderText(value)) {
            return errors::malformedCredential(scheme, "Authorization header contains invalid characters");
        }
        return std::string(value);
    }

    // Splits "<scheme> <rest>" on the first space and requires an exact scheme token.
    std::optional<std::string> payloadAfterScheme(const std::string& authorization, std::string_view scheme) {
        auto sp = authorization.find(' ');
        if (sp == std::string::npos) {
            return std::nullopt;
        }
        if (std::string_view(authorization.data(), sp) != scheme) {
            return std::nullopt;
        }
        return authorization.substr(sp + 1);
    }
}

bool isHeaderText(std::string_view value) {
    for (char c : value) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u == '\t') {
            continue;
        }
        if (u < 0x20 || u > 0x7E) {
            return false;
        }
    }
    return true;
}

std::string maskSecret(const std::string& secret) {
    if (secret.size() <= 4) {
        return std::string("***");
    }
    return secret.substr(0, 4) + "***";
}

std::string describe(const BasicAuthPair& pair) {
    std::string s = "BasicAuthPair{username=" + pair.username + ", password=";
    s += pair.password.has_value() ? std::string("***") : std::string("<none>");
    s += "}";
    return s;
}

std::string describe(const RawCredential& credential) {
    if (const auto* k = std::get_if<ApiKeyValue>(&credential)) {
        return "ApiKeyValue{" + maskSecret(k->value) + "}";
    }
    if (const auto* b = std::get_if<BasicAuthPair>(&credential)) {
        return describe(*b);
    }
    const auto& t = std::get<BearerTokenValue>(credential);
    return "BearerTokenValue{" + maskSecret(t.value) + "}";
}

AuthResult<ApiKeyValue> extractApiKey(const HeaderFields& headers, std::string_view headerName) {
    auto it = headers.find(boost::beast::string_view(headerName.data(), headerName.size()));
    if (it == headers.end()) {
        return errors::missingCredential(AuthScheme::ApiKey, std::string("API key header '") + std::string(headerName) + "' not found");
    }
    std::string_view value(it->value().data(), it->value().size());
    if (!isHeaderText(value)) {
        return errors::malformedCredential(AuthScheme::ApiKey, "API key header value is not a visible ASCII string");
    }
    ApiKeyValue key{std::string(value)};
    LOG_DEBUG("Extracted {}", describe(RawCredential(key)));
    return key;
}

AuthResult<BasicAuthPair> extractBasicAuth(const HeaderFields& headers) {
    auto authorization = readAuthorization(headers, AuthScheme::Basic);
    if (!authorization) {
        return authorization.error();
    }
    auto encoded = payloadAfterScheme(authorization.value(), "Basic");
    if (!encoded.has_value()) {
        return errors::malformedCredential(AuthScheme::Basic, "Authorization header is not Basic");
    }
    auto decoded = base64Decode(*encoded);
    if (!decoded.has_value()) {
        return errors::decodeFailure(AuthScheme::Basic, "Authorization header could not be decoded: invalid base64");
    }
    if (!isValidUtf8(*decoded)) {
        return errors::decodeFailure(AuthScheme::Basic, "Decoded authorization header is not valid UTF-8");
    }

    BasicAuthPair pair;
    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        pair.username = std::move(*decoded);
    } else {
        pair.username = decoded->substr(0, colon);
        pair.password = decoded->substr(colon + 1);
    }
    LOG_DEBUG("Extracted {}", describe(pair));
    return pair;
}

AuthResult<BearerTokenValue> extractBearerToken(const HeaderFields& headers) {
    auto authorization = readAuthorization(headers, AuthScheme::Bearer);
    if (!authorization) {
        return authorization.error();
    }
    auto token = payloadAfterScheme(authorization.value(), "Bearer");
    if (!token.has_value()) {
        return errors::malformedCredential(AuthScheme::Bearer, "Authorization header is not Bearer");
    }
    if (token->empty()) {
        return errors::malformedCredential(AuthScheme::Bearer, "Bearer token is empty");
    }
    BearerTokenValue value{std::move(*token)};
    LOG_DEBUG("Extracted {}", describe(RawCredential(value)));
    return value;
}

} // namespace authgate::auth

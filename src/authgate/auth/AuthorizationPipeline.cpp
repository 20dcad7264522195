//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/AuthorizationPipeline.cpp
// Purpose: API key and Basic-auth authorization against the credential store
//==========================================================================================================

#include <utility>

#include "authgate/auth/AuthorizationPipeline.hpp"
#include "logging/Logger.h"

namespace authgate::auth {

using errors::AuthResult;
using errors::AuthScheme;

AuthorizationPipeline::AuthorizationPipeline(std::shared_ptr<const ICredentialStore> s,
                                             std::shared_ptr<KeySetCache> k,
                                             PipelineOptions opts)
    : store(std::move(s)), keys(std::move(k)), options(std::move(opts)), verifier(options.jwt) {}

AuthResult<ValidApiKey> AuthorizationPipeline::AuthorizeApiKey(const HeaderFields& headers) const {
    auto key = extractApiKey(headers, options.apiKeyHeader);
    if (!key) {
        return key.error();
    }
    if (!store) {
        return errors::internalError(AuthScheme::ApiKey, "no credential store configured");
    }
    bool valid = false;
    try {
        valid = store->IsValidApiKey(key.value().value);
    } catch (const std::exception& e) {
        return errors::internalError(AuthScheme::ApiKey, std::string("API key validation failed: ") + e.what());
    }
    if (!valid) {
        return errors::invalidCredential(AuthScheme::ApiKey, "API key " + maskSecret(key.value().value) + " is not valid");
    }
    LOG_DEBUG("API key {} accepted", maskSecret(key.value().value));
    return ValidApiKey{std::move(key).value().value};
}

AuthResult<AuthenticatedUser> AuthorizationPipeline::AuthorizeBasic(const HeaderFields& headers) const {
    auto pair = extractBasicAuth(headers);
    if (!pair) {
        return pair.error();
    }
    if (!store) {
        return errors::internalError(AuthScheme::Basic, "no credential store configured");
    }
    bool valid = false;
    try {
        valid = store->Authenticate(pair.value().username, pair.value().password);
    } catch (const std::exception& e) {
        return errors::internalError(AuthScheme::Basic, std::string("Basic credential validation failed: ") + e.what());
    }
    if (!valid) {
        return errors::invalidCredential(AuthScheme::Basic, "invalid username or password for user '" + pair.value().username + "'");
    }
    LOG_DEBUG("Basic user '{}' authenticated", pair.value().username);
    return AuthenticatedUser{std::move(pair).value().username};
}

} // namespace authgate::auth

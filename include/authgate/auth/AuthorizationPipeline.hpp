//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthorizationPipeline.hpp
// Purpose: End-to-end credential decision: extraction, allow-list or JWT verification, typed principal
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>

#include <boost/asio/awaitable.hpp>

#include "authgate/auth/CredentialExtractors.hpp"
#include "authgate/auth/CredentialStore.hpp"
#include "authgate/auth/JwtVerifier.hpp"
#include "authgate/auth/KeySetCache.hpp"
#include "authgate/errors/AuthError.h"

namespace authgate::auth {

// API key confirmed against the allow-list.
struct ValidApiKey {
    std::string value;
};

// Basic-auth user confirmed against the allow-list.
struct AuthenticatedUser {
    std::string username;
};

template <typename C>
using Principal = std::variant<ValidApiKey, AuthenticatedUser, ValidatedClaims<C>>;

//==========================================================================================================
// PipelineOptions
// Fields:
//   apiKeyHeader: Header carrying the API key.
//   jwt: Audience/issuer/not-before/leeway checks for bearer tokens.
//==========================================================================================================
struct PipelineOptions {
    std::string apiKeyHeader{kDefaultApiKeyHeader};
    JwtValidationOptions jwt;
};

//==========================================================================================================
// AuthorizationPipeline
// Purpose: Sequences extractor -> verification and returns the first failure. Holds no per-request
//          state; safe to share across concurrent requests. Failures raised by the credential store are
//          reported as Internal errors.
// Notes:
//   - headers passed to the coroutine members must outlive the returned awaitable.
//   - Without a KeySetCache, bearer authorization fails with an Internal error.
//==========================================================================================================
class AuthorizationPipeline {
public:
    AuthorizationPipeline(std::shared_ptr<const ICredentialStore> store,
                          std::shared_ptr<KeySetCache> keys,
                          PipelineOptions options = {});

    errors::AuthResult<ValidApiKey> AuthorizeApiKey(const HeaderFields& headers) const;
    errors::AuthResult<AuthenticatedUser> AuthorizeBasic(const HeaderFields& headers) const;

    template <typename C>
    boost::asio::awaitable<errors::AuthResult<ValidatedClaims<C>>> AuthorizeBearer(const HeaderFields& headers) const {
        auto token = extractBearerToken(headers);
        if (!token) {
            co_return token.error();
        }
        if (!keys) {
            co_return errors::internalError(errors::AuthScheme::Bearer, "bearer authentication is not configured");
        }
        std::shared_ptr<const KeySetSnapshot> snapshot = co_await keys->Snapshot();
        co_return verifier.Validate<C>(token.value().value, *snapshot);
    }

    template <typename C>
    boost::asio::awaitable<errors::AuthResult<Principal<C>>> Authorize(errors::AuthScheme scheme,
                                                                       const HeaderFields& headers) const {
        switch (scheme) {
            case errors::AuthScheme::ApiKey: {
                auto r = AuthorizeApiKey(headers);
                if (!r) {
                    co_return r.error();
                }
                co_return Principal<C>(std::move(r).value());
            }
            case errors::AuthScheme::Basic: {
                auto r = AuthorizeBasic(headers);
                if (!r) {
                    co_return r.error();
                }
                co_return Principal<C>(std::move(r).value());
            }
            case errors::AuthScheme::Bearer: {
                auto r = co_await AuthorizeBearer<C>(headers);
                if (!r) {
                    co_return r.error();
                }
                co_return Principal<C>(std::move(r).value());
            }
            case errors::AuthScheme::None:
                break;
        }
        co_return errors::internalError(errors::AuthScheme::None, "no authentication scheme requested");
    }

    const PipelineOptions& Options() const { return options; }
    const JwtVerifier& Verifier() const { return verifier; }
    bool BearerEnabled() const { return keys != nullptr; }

private:
    std::shared_ptr<const ICredentialStore> store;
    std::shared_ptr<KeySetCache> keys;
    PipelineOptions options;
    JwtVerifier verifier;
};

} // namespace authgate::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JwtVerifier.hpp
// Purpose: RSA JWT (JWS compact) verification against a key-set snapshot, and typed validated claims
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "authgate/JSONValue.h"
#include "authgate/auth/KeySet.hpp"
#include "authgate/errors/AuthError.h"

namespace authgate::auth {

// Signing algorithms accepted for RSA keys.
enum class JwtAlgorithm {
    RS256,
    RS384,
    RS512,
    PS256,
    PS384,
    PS512
};

const char* algorithmName(JwtAlgorithm alg) noexcept;
std::optional<JwtAlgorithm> algorithmFromName(std::string_view name);

// Cause of a verification failure; only ExpiredSignature maps to TokenExpired.
enum class JwtFailure {
    MalformedToken,
    MissingKeyId,
    UnknownKeyId,
    UnsupportedKeyType,
    InvalidKey,
    UnsupportedAlgorithm,
    AlgorithmMismatch,
    InvalidSignature,
    MissingRequiredClaim,
    ExpiredSignature,
    ImmatureSignature,
    InvalidIssuer,
    InvalidAudience
};

const char* failureName(JwtFailure failure) noexcept;

class JwtValidationError : public std::runtime_error {
public:
    JwtValidationError(JwtFailure failure, const std::string& message)
        : std::runtime_error(message), failure(failure) {}

    JwtFailure Failure() const noexcept { return failure; }
    bool IsExpired() const noexcept { return failure == JwtFailure::ExpiredSignature; }

private:
    JwtFailure failure;
};

// Thrown by claims deserializers when the payload does not have the expected shape.
class ClaimsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// JwtValidationOptions
// Purpose: Claim checks applied after the signature is verified.
// Fields:
//   audiences: Accepted audiences; the token's "aud" must intersect them. Not checked when empty.
//   issuers: Accepted issuers; the token's "iss" must be one of them. Not checked when empty.
//   validateNotBefore: Reject tokens whose "nbf" lies in the future.
//   leeway: Clock skew tolerated for "exp" and "nbf".
//==========================================================================================================
struct JwtValidationOptions {
    std::vector<std::string> audiences;
    std::vector<std::string> issuers;
    bool validateNotBefore{true};
    std::chrono::seconds leeway{60};
};

// Decoded JOSE header fields relevant for key selection.
struct JwtHeader {
    std::string alg;
    std::string kid;
    std::string typ;
};

// Decodes the header segment without verifying anything. Throws JwtValidationError(MalformedToken).
JwtHeader decodeJwtHeader(const std::string& token);

//==========================================================================================================
// ClaimsTraits
// Purpose: Customization point turning a verified payload into a caller-defined claims type. The
//          default calls C::FromJSON(payload); deserializers throw on shape mismatch.
//==========================================================================================================
template <typename C>
struct ClaimsTraits {
    static C fromJSON(const JSONValue& payload) { return C::FromJSON(payload); }
};

template <>
struct ClaimsTraits<JSONValue> {
    static JSONValue fromJSON(const JSONValue& payload) { return payload; }
};

class JwtVerifier;

//==========================================================================================================
// ValidatedClaims
// Purpose: Claims of a token that passed full verification. Only JwtVerifier can create one.
//==========================================================================================================
template <typename C>
class ValidatedClaims {
public:
    const C& Claims() const { return claims; }
    const C* operator->() const { return &claims; }

private:
    friend class JwtVerifier;
    explicit ValidatedClaims(C c) : claims(std::move(c)) {}

    C claims;
};

//==========================================================================================================
// OidcClaims
// Purpose: Standard OpenID Connect ID/access token claims.
// Fields:
//   sub: Subject (required).
//   roles: Union of "roles" and "realm_access.roles" when present.
//==========================================================================================================
struct OidcClaims {
    std::string sub;
    std::optional<std::string> iss;
    std::vector<std::string> audiences;
    std::optional<int64_t> exp;
    std::optional<int64_t> iat;
    std::optional<bool> emailVerified;
    std::optional<std::string> name;
    std::optional<std::string> preferredUsername;
    std::optional<std::string> givenName;
    std::optional<std::string> familyName;
    std::optional<std::string> email;
    std::vector<std::string> roles;

    // Throws ClaimsError when "sub" is missing or not a string.
    static OidcClaims FromJSON(const JSONValue& payload);
    JSONValue ToJSON() const;
};

//==========================================================================================================
// JwtVerifier
// Purpose: Verifies RS*/PS* signed JWTs. Steps, stopping at the first failure:
//   1. decode header, require "kid"            5. map the key's "alg"; the header "alg" must match
//   2. find "kid" in the snapshot              6. verify the signature
//   3. require an RSA key                      7. check exp (required), nbf, iss, aud
//   4. build the public key from n/e
//   Failures are classified once, on catch: ExpiredSignature -> TokenExpired, anything else ->
//   TokenInvalid carrying the cause. A payload that verifies but does not deserialize into C is an
//   Internal error.
//==========================================================================================================
class JwtVerifier {
public:
    explicit JwtVerifier(JwtValidationOptions options = {});

    // Runs steps 1-7 and returns the payload. Throws JwtValidationError.
    JSONValue VerifyToken(const std::string& token, const KeySetSnapshot& keys) const;
    JSONValue VerifyToken(const std::string& token, const KeySetSnapshot& keys,
                          const JwtValidationOptions& checks) const;

    template <typename C>
    errors::AuthResult<ValidatedClaims<C>> Validate(const std::string& token, const KeySetSnapshot& keys) const {
        return Validate<C>(token, keys, options);
    }

    template <typename C>
    errors::AuthResult<ValidatedClaims<C>> Validate(const std::string& token,
                                                    const KeySetSnapshot& keys,
                                                    const std::vector<std::string>& audiences,
                                                    const std::vector<std::string>& issuers,
                                                    bool validateNotBefore) const {
        JwtValidationOptions checks = options;
        checks.audiences = audiences;
        checks.issuers = issuers;
        checks.validateNotBefore = validateNotBefore;
        return Validate<C>(token, keys, checks);
    }

    template <typename C>
    errors::AuthResult<ValidatedClaims<C>> Validate(const std::string& token,
                                                    const KeySetSnapshot& keys,
                                                    const JwtValidationOptions& checks) const {
        JSONValue payload;
        try {
            payload = VerifyToken(token, keys, checks);
        } catch (const JwtValidationError& e) {
            return classify(e);
        }
        try {
            return ValidatedClaims<C>(ClaimsTraits<C>::fromJSON(payload));
        } catch (const std::exception& e) {
            return claimsFailure(e);
        }
    }

    const JwtValidationOptions& Options() const { return options; }

private:
    static errors::AuthError classify(const JwtValidationError& e);
    static errors::AuthError claimsFailure(const std::exception& e);

    JwtValidationOptions options;
};

//==========================================================================================================
// requireAnyRole
// Purpose: Role authorization, separate from token validity.
// Returns:
//   std::nullopt when allowed is empty or have intersects allowed; InsufficientRole otherwise.
//==========================================================================================================
std::optional<errors::AuthError> requireAnyRole(const std::vector<std::string>& have,
                                                const std::vector<std::string>& allowed,
                                                errors::AuthScheme scheme = errors::AuthScheme::Bearer);

} // namespace authgate::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthError.h
// Purpose: Authentication error taxonomy, verbosity policy and the AuthResult value/error carrier
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace authgate {
namespace errors {

// How much of an error is disclosed to the client. Never affects the error kind.
enum class ErrorVerbosity {
    None,
    StatusOnly,
    Message,
    TypeOnly,
    Full
};

// Categorization of authentication and verification failures.
enum class AuthErrorKind {
    MissingCredential,
    MalformedCredential,
    DecodeFailure,
    InvalidCredential,
    TokenExpired,
    TokenInvalid,
    InsufficientRole,
    Internal
};

// Credential scheme an error concerns; selects the WWW-Authenticate challenge.
enum class AuthScheme {
    None,
    ApiKey,
    Basic,
    Bearer
};

//==========================================================================================================
// AuthError
// Purpose: A single authentication failure.
// Fields:
//   kind: Failure category; fixes the status code and summary.
//   scheme: Scheme of the credential that was being processed.
//   detail: Underlying reason (decode error, library text, claim mismatch). Disclosed only at Full.
//==========================================================================================================
struct AuthError {
    AuthErrorKind kind{AuthErrorKind::Internal};
    AuthScheme scheme{AuthScheme::None};
    std::string detail;
};

// Fixed HTTP status for each kind.
int statusCodeFor(AuthErrorKind kind) noexcept;

// Fixed human-readable summary for each kind.
const char* summaryFor(AuthErrorKind kind) noexcept;

// Stable kind identifier used in JSON bodies, e.g. "TokenExpired".
const char* kindName(AuthErrorKind kind) noexcept;

const char* schemeName(AuthScheme scheme) noexcept;
const char* verbosityName(ErrorVerbosity verbosity) noexcept;

//==========================================================================================================
// verbosityFromString
// Purpose: Parses a verbosity name (none, status_only, message, type_only, full; case-insensitive,
//          '-' accepted in place of '_').
// Returns:
//   The verbosity, or std::nullopt for unknown names.
//==========================================================================================================
std::optional<ErrorVerbosity> verbosityFromString(std::string_view name);

//==========================================================================================================
// makeAuthError
// Purpose: Constructs an AuthError and emits the diagnostic log record for it. Internal failures are
//          logged at ERROR level, credential rejections at WARN level. Logging is independent of the
//          verbosity later used to render the error.
//==========================================================================================================
AuthError makeAuthError(AuthErrorKind kind, AuthScheme scheme, std::string detail = {});

inline AuthError missingCredential(AuthScheme scheme, std::string detail = {}) {
    return makeAuthError(AuthErrorKind::MissingCredential, scheme, std::move(detail));
}
inline AuthError malformedCredential(AuthScheme scheme, std::string detail) {
    return makeAuthError(AuthErrorKind::MalformedCredential, scheme, std::move(detail));
}
inline AuthError decodeFailure(AuthScheme scheme, std::string detail) {
    return makeAuthError(AuthErrorKind::DecodeFailure, scheme, std::move(detail));
}
inline AuthError invalidCredential(AuthScheme scheme, std::string detail = {}) {
    return makeAuthError(AuthErrorKind::InvalidCredential, scheme, std::move(detail));
}
inline AuthError tokenExpired(std::string detail = {}) {
    return makeAuthError(AuthErrorKind::TokenExpired, AuthScheme::Bearer, std::move(detail));
}
inline AuthError tokenInvalid(std::string detail) {
    return makeAuthError(AuthErrorKind::TokenInvalid, AuthScheme::Bearer, std::move(detail));
}
inline AuthError insufficientRole(AuthScheme scheme, std::string detail = {}) {
    return makeAuthError(AuthErrorKind::InsufficientRole, scheme, std::move(detail));
}
inline AuthError internalError(AuthScheme scheme, std::string detail) {
    return makeAuthError(AuthErrorKind::Internal, scheme, std::move(detail));
}

//==========================================================================================================
// AuthResult
// Purpose: Either a successfully produced value or the AuthError explaining why none was produced.
//==========================================================================================================
template <typename T>
class AuthResult {
public:
    AuthResult(T value) : state(std::in_place_index<0>, std::move(value)) {}
    AuthResult(AuthError error) : state(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return state.index() == 0; }
    explicit operator bool() const { return ok(); }

    // Precondition: ok()
    T& value() & { return std::get<0>(state); }
    const T& value() const & { return std::get<0>(state); }
    T&& value() && { return std::get<0>(std::move(state)); }

    // Precondition: !ok()
    const AuthError& error() const { return std::get<1>(state); }

private:
    std::variant<T, AuthError> state;
};

} // namespace errors
} // namespace authgate

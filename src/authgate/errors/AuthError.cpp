//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/errors/AuthError.cpp
// Purpose: Status/summary tables for the error taxonomy and logged AuthError construction
//==========================================================================================================

#include <cctype>
#include <string>

#include "authgate/errors/AuthError.h"
#include "logging/Logger.h"

namespace authgate {
namespace errors {

int statusCodeFor(AuthErrorKind kind) noexcept {
    switch (kind) {
        case AuthErrorKind::MissingCredential: return 401;
        case AuthErrorKind::MalformedCredential: return 401;
        case AuthErrorKind::DecodeFailure: return 401;
        case AuthErrorKind::InvalidCredential: return 403;
        case AuthErrorKind::TokenExpired: return 401;
        case AuthErrorKind::TokenInvalid: return 401;
        case AuthErrorKind::InsufficientRole: return 403;
        case AuthErrorKind::Internal: return 500;
    }
    return 500;
}

const char* summaryFor(AuthErrorKind kind) noexcept {
    switch (kind) {
        case AuthErrorKind::MissingCredential: return "Credentials are missing";
        case AuthErrorKind::MalformedCredential: return "Credentials are malformed";
        case AuthErrorKind::DecodeFailure: return "Credentials could not be decoded";
        case AuthErrorKind::InvalidCredential: return "Credentials are invalid";
        case AuthErrorKind::TokenExpired: return "Token has expired";
        case AuthErrorKind::TokenInvalid: return "Token is invalid";
        case AuthErrorKind::InsufficientRole: return "Insufficient role";
        case AuthErrorKind::Internal: return "An internal server error has occurred";
    }
    return "An internal server error has occurred";
}

const char* kindName(AuthErrorKind kind) noexcept {
    switch (kind) {
        case AuthErrorKind::MissingCredential: return "MissingCredential";
        case AuthErrorKind::MalformedCredential: return "MalformedCredential";
        case AuthErrorKind::DecodeFailure: return "DecodeFailure";
        case AuthErrorKind::InvalidCredential: return "InvalidCredential";
        case AuthErrorKind::TokenExpired: return "TokenExpired";
        case AuthErrorKind::TokenInvalid: return "TokenInvalid";
        case AuthErrorKind::InsufficientRole: return "InsufficientRole";
        case AuthErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

const char* schemeName(AuthScheme scheme) noexcept {
    switch (scheme) {
        case AuthScheme::None: return "none";
        case AuthScheme::ApiKey: return "api-key";
        case AuthScheme::Basic: return "basic";
        case AuthScheme::Bearer: return "bearer";
    }
    return "none";
}

const char* verbosityName(ErrorVerbosity verbosity) noexcept {
    switch (verbosity) {
        case ErrorVerbosity::None: return "none";
        case ErrorVerbosity::StatusOnly: return "status_only";
        case ErrorVerbosity::Message: return "message";
        case ErrorVerbosity::TypeOnly: return "type_only";
        case ErrorVerbosity::Full: return "full";
    }
    return "full";
}

std::optional<ErrorVerbosity> verbosityFromString(std::string_view name) {
    std::string s;
    s.reserve(name.size());
    for (char c : name) {
        char lc = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        s.push_back(lc == '-' ? '_' : lc);
    }
    if (s == "none") return ErrorVerbosity::None;
    if (s == "status_only" || s == "status") return ErrorVerbosity::StatusOnly;
    if (s == "message") return ErrorVerbosity::Message;
    if (s == "type_only" || s == "type") return ErrorVerbosity::TypeOnly;
    if (s == "full") return ErrorVerbosity::Full;
    return std::nullopt;
}

AuthError makeAuthError(AuthErrorKind kind, AuthScheme scheme, std::string detail) {
    if (kind == AuthErrorKind::Internal) {
        LOG_ERROR("auth {} [{}]: {}", kindName(kind), schemeName(scheme), detail.empty() ? summaryFor(kind) : detail);
    } else {
        LOG_WARN("auth {} [{}]: {}", kindName(kind), schemeName(scheme), detail.empty() ? summaryFor(kind) : detail);
    }
    AuthError e;
    e.kind = kind;
    e.scheme = scheme;
    e.detail = std::move(detail);
    return e;
}

} // namespace errors
} // namespace authgate

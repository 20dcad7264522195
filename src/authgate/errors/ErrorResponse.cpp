//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/errors/ErrorResponse.cpp
// Purpose: Verbosity-driven rendering of AuthError values into HTTP response descriptors
//==========================================================================================================

#include <cctype>
#include <memory>

#include "authgate/errors/ErrorResponse.h"
#include "authgate/auth/WwwAuthenticate.hpp"
#include "authgate/JSONValue.h"

namespace authgate {
namespace errors {

namespace {
    bool iequals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string challengeFor(const AuthError& error, const RenderOptions& options) {
        auth::WwwAuthChallenge ch;
        if (error.scheme == AuthScheme::Basic) {
            ch.scheme = "Basic";
        } else if (error.scheme == AuthScheme::Bearer) {
            ch.scheme = "Bearer";
        } else {
            return std::string();
        }
        if (!options.realm.empty()) {
            ch.params["realm"] = options.realm;
        }
        return auth::buildWwwAuthenticate(ch);
    }
}

std::string ErrorResponse::header(const std::string& name) const {
    for (const auto& h : headers) {
        if (iequals(h.name, name)) {
            return h.value;
        }
    }
    return std::string();
}

ErrorResponse renderAuthError(const AuthError& error, ErrorVerbosity verbosity, const RenderOptions& options) {
    ErrorResponse r;
    if (verbosity == ErrorVerbosity::None) {
        r.statusCode = 204;
        return r;
    }

    r.statusCode = statusCodeFor(error.kind);
    if (r.statusCode == 401 || r.statusCode == 403) {
        std::string challenge = challengeFor(error, options);
        if (!challenge.empty()) {
            r.headers.push_back(HeaderKV{"WWW-Authenticate", std::move(challenge)});
        }
    }
    if (verbosity == ErrorVerbosity::StatusOnly) {
        return r;
    }

    JSONValue::Object body;
    body["message"] = std::make_shared<JSONValue>(summaryFor(error.kind));
    if (verbosity == ErrorVerbosity::TypeOnly || verbosity == ErrorVerbosity::Full) {
        body["type"] = std::make_shared<JSONValue>(kindName(error.kind));
    }
    if (verbosity == ErrorVerbosity::Full && !error.detail.empty()) {
        body["detail"] = std::make_shared<JSONValue>(error.detail);
    }
    r.headers.push_back(HeaderKV{"Content-Type", "application/json"});
    r.body = serializeJSONValue(JSONValue(std::move(body)));
    return r;
}

} // namespace errors
} // namespace authgate

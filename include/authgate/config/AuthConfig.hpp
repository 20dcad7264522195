//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthConfig.hpp
// Purpose: Process configuration for authgate read from AUTHGATE_* environment variables
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "authgate/auth/JwtVerifier.hpp"
#include "authgate/errors/AuthError.h"
#include "logging/Logger.h"

namespace authgate::config {

// Thrown when a configuration value cannot be interpreted.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// AuthConfig
// Purpose: Immutable startup configuration.
// Fields:
//   verbosity: AUTHGATE_ERROR_VERBOSITY (default full)
//   apiKeyHeader: AUTHGATE_API_KEY_HEADER (default x-api-key)
//   apiKeys: AUTHGATE_API_KEYS, comma-separated
//   basicUsers: AUTHGATE_BASIC_USERS, comma-separated user:password or bare user
//   jwksUri: AUTHGATE_JWKS_URI; bearer authentication is disabled when empty
//   jwksTtl: AUTHGATE_JWKS_TTL_SECONDS (default 300)
//   jwtIssuer: AUTHGATE_JWT_ISSUER
//   jwtAudiences: AUTHGATE_JWT_AUDIENCES, comma-separated
//   validateNotBefore: AUTHGATE_JWT_VALIDATE_NBF (default true)
//   leeway: AUTHGATE_JWT_LEEWAY_SECONDS (default 60)
//   realm: AUTHGATE_AUTH_REALM
//   logLevel: AUTHGATE_LOG_LEVEL (default INFO)
//==========================================================================================================
struct AuthConfig {
    errors::ErrorVerbosity verbosity{errors::ErrorVerbosity::Full};
    std::string apiKeyHeader{"x-api-key"};
    std::vector<std::string> apiKeys;
    std::unordered_map<std::string, std::optional<std::string>> basicUsers;
    std::string jwksUri;
    std::chrono::seconds jwksTtl{300};
    std::string jwtIssuer;
    std::vector<std::string> jwtAudiences;
    bool validateNotBefore{true};
    std::chrono::seconds leeway{60};
    std::string realm;
    LogLevel logLevel{LogLevel::LOG_INFO_LEVEL};

    // Reads and validates every AUTHGATE_* variable. Throws ConfigError.
    static AuthConfig FromEnvironment();

    // JWT claim checks derived from issuer/audiences/nbf/leeway.
    auth::JwtValidationOptions JwtOptions() const;
};

// Splits on ',', trims blanks around each item and drops empty items.
std::vector<std::string> splitList(const std::string& value);

// Parses "user:password" / "user" items into the Basic-auth user table. Throws ConfigError on empty user names.
std::unordered_map<std::string, std::optional<std::string>> parseBasicUsers(const std::string& value);

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive). Throws ConfigError.
bool parseBool(const std::string& name, const std::string& value);

// Accepts a non-negative decimal integer. Throws ConfigError.
int64_t parseSeconds(const std::string& name, const std::string& value);

} // namespace authgate::config

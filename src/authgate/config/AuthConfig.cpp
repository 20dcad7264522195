//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/config/AuthConfig.cpp
// Purpose: AUTHGATE_* environment parsing and validation
//==========================================================================================================

#include <cctype>
#include <limits>

#include "authgate/config/AuthConfig.hpp"
#include "env/EnvVars.h"

namespace authgate::config {

namespace {
    std::string trim(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
        return s.substr(b, e - b);
    }

    std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    LogLevel parseLogLevel(const std::string& value) {
        const std::string v = lower(trim(value));
        if (v != "debug" && v != "info" && v != "warn" && v != "warning" && v != "error" && v != "fatal") {
            throw ConfigError("AUTHGATE_LOG_LEVEL: unknown level '" + value + "'");
        }
        return Logger::levelFromString(v);
    }
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        start = comma + 1;
    }
    return out;
}

std::unordered_map<std::string, std::optional<std::string>> parseBasicUsers(const std::string& value) {
    std::unordered_map<std::string, std::optional<std::string>> users;
    for (const auto& item : splitList(value)) {
        auto colon = item.find(':');
        std::string user = colon == std::string::npos ? item : item.substr(0, colon);
        if (user.empty()) {
            throw ConfigError("AUTHGATE_BASIC_USERS: entry with empty user name");
        }
        if (colon == std::string::npos) {
            users[user] = std::nullopt;
        } else {
            users[user] = item.substr(colon + 1);
        }
    }
    return users;
}

bool parseBool(const std::string& name, const std::string& value) {
    const std::string v = lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(name + ": expected a boolean, got '" + value + "'");
}

int64_t parseSeconds(const std::string& name, const std::string& value) {
    const std::string v = trim(value);
    if (v.empty() || v.size() > 12) {
        throw ConfigError(name + ": expected a number of seconds, got '" + value + "'");
    }
    int64_t n = 0;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError(name + ": expected a number of seconds, got '" + value + "'");
        }
        n = n * 10 + (c - '0');
    }
    return n;
}

AuthConfig AuthConfig::FromEnvironment() {
    AuthConfig c;

    const std::string verbosity = GetEnvOrDefault("AUTHGATE_ERROR_VERBOSITY", "full");
    auto v = errors::verbosityFromString(trim(verbosity));
    if (!v.has_value()) {
        throw ConfigError("AUTHGATE_ERROR_VERBOSITY: unknown verbosity '" + verbosity + "'");
    }
    c.verbosity = *v;

    c.apiKeyHeader = trim(GetEnvOrDefault("AUTHGATE_API_KEY_HEADER", "x-api-key"));
    c.apiKeys = splitList(GetEnvOrDefault("AUTHGATE_API_KEYS", ""));
    c.basicUsers = parseBasicUsers(GetEnvOrDefault("AUTHGATE_BASIC_USERS", ""));

    c.jwksUri = trim(GetEnvOrDefault("AUTHGATE_JWKS_URI", ""));
    if (!c.jwksUri.empty() && c.jwksUri.rfind("http://", 0) != 0 && c.jwksUri.rfind("https://", 0) != 0) {
        throw ConfigError("AUTHGATE_JWKS_URI: expected an http:// or https:// URL, got '" + c.jwksUri + "'");
    }
    c.jwksTtl = std::chrono::seconds(parseSeconds("AUTHGATE_JWKS_TTL_SECONDS", GetEnvOrDefault("AUTHGATE_JWKS_TTL_SECONDS", "300")));
    c.jwtIssuer = trim(GetEnvOrDefault("AUTHGATE_JWT_ISSUER", ""));
    c.jwtAudiences = splitList(GetEnvOrDefault("AUTHGATE_JWT_AUDIENCES", ""));
    c.validateNotBefore = parseBool("AUTHGATE_JWT_VALIDATE_NBF", GetEnvOrDefault("AUTHGATE_JWT_VALIDATE_NBF", "true"));
    c.leeway = std::chrono::seconds(parseSeconds("AUTHGATE_JWT_LEEWAY_SECONDS", GetEnvOrDefault("AUTHGATE_JWT_LEEWAY_SECONDS", "60")));
    c.realm = GetEnvOrDefault("AUTHGATE_AUTH_REALM", "");
    c.logLevel = parseLogLevel(GetEnvOrDefault("AUTHGATE_LOG_LEVEL", "INFO"));
    return c;
}

auth::JwtValidationOptions AuthConfig::JwtOptions() const {
    auth::JwtValidationOptions o;
    o.audiences = jwtAudiences;
    if (!jwtIssuer.empty()) {
        o.issuers.push_back(jwtIssuer);
    }
    o.validateNotBefore = validateNotBefore;
    o.leeway = leeway;
    return o;
}

} // namespace authgate::config

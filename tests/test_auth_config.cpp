//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_auth_config.cpp
// Purpose: GoogleTests for AUTHGATE_* environment configuration and the dotenv loader
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "authgate/config/AuthConfig.hpp"
#include "env/EnvVars.h"

using namespace authgate;
using namespace authgate::config;

namespace {

const char* kVars[] = {
    "AUTHGATE_ERROR_VERBOSITY", "AUTHGATE_API_KEY_HEADER", "AUTHGATE_API_KEYS", "AUTHGATE_BASIC_USERS",
    "AUTHGATE_JWKS_URI", "AUTHGATE_JWKS_TTL_SECONDS", "AUTHGATE_JWT_ISSUER", "AUTHGATE_JWT_AUDIENCES",
    "AUTHGATE_JWT_VALIDATE_NBF", "AUTHGATE_JWT_LEEWAY_SECONDS", "AUTHGATE_AUTH_REALM", "AUTHGATE_LOG_LEVEL",
    "AUTHGATE_TEST_FROM_FILE", "AUTHGATE_TEST_QUOTED", "AUTHGATE_TEST_PRESET"};

class AuthConfigEnv : public ::testing::Test {
protected:
    void SetUp() override { clearAll(); }
    void TearDown() override { clearAll(); }

    static void clearAll() {
        for (const char* name : kVars) {
            ::unsetenv(name);
        }
    }

    static void set(const char* name, const char* value) { ::setenv(name, value, 1); }
};

} // namespace

TEST_F(AuthConfigEnv, DefaultsWhenNothingIsSet) {
    AuthConfig c = AuthConfig::FromEnvironment();
    EXPECT_EQ(c.verbosity, errors::ErrorVerbosity::Full);
    EXPECT_EQ(c.apiKeyHeader, "x-api-key");
    EXPECT_TRUE(c.apiKeys.empty());
    EXPECT_TRUE(c.basicUsers.empty());
    EXPECT_TRUE(c.jwksUri.empty());
    EXPECT_EQ(c.jwksTtl, std::chrono::seconds(300));
    EXPECT_TRUE(c.jwtIssuer.empty());
    EXPECT_TRUE(c.jwtAudiences.empty());
    EXPECT_TRUE(c.validateNotBefore);
    EXPECT_EQ(c.leeway, std::chrono::seconds(60));
    EXPECT_EQ(c.logLevel, LogLevel::LOG_INFO_LEVEL);
}

TEST_F(AuthConfigEnv, ReadsEveryVariable) {
    set("AUTHGATE_ERROR_VERBOSITY", "status-only");
    set("AUTHGATE_API_KEY_HEADER", " x-service-key ");
    set("AUTHGATE_API_KEYS", "k1, k2,,k3 ");
    set("AUTHGATE_BASIC_USERS", "alice:secret,svc");
    set("AUTHGATE_JWKS_URI", "https://idp.example.com/.well-known/jwks.json");
    set("AUTHGATE_JWKS_TTL_SECONDS", "120");
    set("AUTHGATE_JWT_ISSUER", "https://idp.example.com/");
    set("AUTHGATE_JWT_AUDIENCES", "orders,billing");
    set("AUTHGATE_JWT_VALIDATE_NBF", "off");
    set("AUTHGATE_JWT_LEEWAY_SECONDS", "5");
    set("AUTHGATE_AUTH_REALM", "orders");
    set("AUTHGATE_LOG_LEVEL", "debug");

    AuthConfig c = AuthConfig::FromEnvironment();
    EXPECT_EQ(c.verbosity, errors::ErrorVerbosity::StatusOnly);
    EXPECT_EQ(c.apiKeyHeader, "x-service-key");
    EXPECT_EQ(c.apiKeys, (std::vector<std::string>{"k1", "k2", "k3"}));
    ASSERT_EQ(c.basicUsers.size(), 2u);
    EXPECT_EQ(c.basicUsers.at("alice"), std::optional<std::string>("secret"));
    EXPECT_FALSE(c.basicUsers.at("svc").has_value());
    EXPECT_EQ(c.jwksUri, "https://idp.example.com/.well-known/jwks.json");
    EXPECT_EQ(c.jwksTtl, std::chrono::seconds(120));
    EXPECT_EQ(c.jwtIssuer, "https://idp.example.com/");
    EXPECT_EQ(c.jwtAudiences, (std::vector<std::string>{"orders", "billing"}));
    EXPECT_FALSE(c.validateNotBefore);
    EXPECT_EQ(c.leeway, std::chrono::seconds(5));
    EXPECT_EQ(c.realm, "orders");
    EXPECT_EQ(c.logLevel, LogLevel::LOG_DEBUG_LEVEL);
}

TEST_F(AuthConfigEnv, JwtOptionsMirrorConfiguration) {
    set("AUTHGATE_JWT_ISSUER", "iss-1");
    set("AUTHGATE_JWT_AUDIENCES", "a,b");
    set("AUTHGATE_JWT_LEEWAY_SECONDS", "0");
    auto o = AuthConfig::FromEnvironment().JwtOptions();
    EXPECT_EQ(o.issuers, (std::vector<std::string>{"iss-1"}));
    EXPECT_EQ(o.audiences, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(o.validateNotBefore);
    EXPECT_EQ(o.leeway, std::chrono::seconds(0));

    ::unsetenv("AUTHGATE_JWT_ISSUER");
    EXPECT_TRUE(AuthConfig::FromEnvironment().JwtOptions().issuers.empty());
}

TEST_F(AuthConfigEnv, InvalidValuesThrowConfigError) {
    set("AUTHGATE_ERROR_VERBOSITY", "chatty");
    EXPECT_THROW(AuthConfig::FromEnvironment(), ConfigError);
    ::unsetenv("AUTHGATE_ERROR_VERBOSITY");

    set("AUTHGATE_JWKS_URI", "ftp://idp.example.com/jwks");
    EXPECT_THROW(AuthConfig::FromEnvironment(), ConfigError);
    ::unsetenv("AUTHGATE_JWKS_URI");

    set("AUTHGATE_JWKS_TTL_SECONDS", "-5");
    EXPECT_THROW(AuthConfig::FromEnvironment(), ConfigError);
    ::unsetenv("AUTHGATE_JWKS_TTL_SECONDS");

    set("AUTHGATE_JWT_VALIDATE_NBF", "maybe");
    EXPECT_THROW(AuthConfig::FromEnvironment(), ConfigError);
    ::unsetenv("AUTHGATE_JWT_VALIDATE_NBF");

    set("AUTHGATE_LOG_LEVEL", "verbose");
    EXPECT_THROW(AuthConfig::FromEnvironment(), ConfigError);
    ::unsetenv("AUTHGATE_LOG_LEVEL");

    set("AUTHGATE_BASIC_USERS", "alice:x,:nouser");
    EXPECT_THROW(AuthConfig::FromEnvironment(), ConfigError);
    ::unsetenv("AUTHGATE_BASIC_USERS");

    EXPECT_NO_THROW(AuthConfig::FromEnvironment());
}

TEST_F(AuthConfigEnv, ErrorMessageNamesTheVariable) {
    set("AUTHGATE_JWT_LEEWAY_SECONDS", "ten");
    try {
        AuthConfig::FromEnvironment();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("AUTHGATE_JWT_LEEWAY_SECONDS"), std::string::npos);
    }
}

TEST(ConfigParsing, SplitList) {
    EXPECT_TRUE(splitList("").empty());
    EXPECT_TRUE(splitList(" , ,").empty());
    EXPECT_EQ(splitList("a"), (std::vector<std::string>{"a"}));
    EXPECT_EQ(splitList(" a , b,c "), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ConfigParsing, BasicUsersKeepColonsInPasswords) {
    auto users = parseBasicUsers("bob:pa:ss, carol:");
    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users.at("bob"), std::optional<std::string>("pa:ss"));
    EXPECT_EQ(users.at("carol"), std::optional<std::string>(""));
}

TEST(ConfigParsing, BoolsAndSeconds) {
    EXPECT_TRUE(parseBool("X", "YES"));
    EXPECT_TRUE(parseBool("X", " 1 "));
    EXPECT_FALSE(parseBool("X", "False"));
    EXPECT_THROW(parseBool("X", ""), ConfigError);
    EXPECT_EQ(parseSeconds("X", "0"), 0);
    EXPECT_EQ(parseSeconds("X", " 3600 "), 3600);
    EXPECT_THROW(parseSeconds("X", ""), ConfigError);
    EXPECT_THROW(parseSeconds("X", "1.5"), ConfigError);
    EXPECT_THROW(parseSeconds("X", "9999999999999"), ConfigError);
}

TEST_F(AuthConfigEnv, LoadEnvFileSetsUnsetVariablesOnly) {
    const auto path = std::filesystem::temp_directory_path() / "authgate_test_env_file.env";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "\n"
            << "AUTHGATE_TEST_FROM_FILE=plain\n"
            << "export AUTHGATE_TEST_QUOTED=\"with spaces\"\n"
            << "AUTHGATE_TEST_PRESET=from-file\n"
            << "not a pair\n";
    }
    set("AUTHGATE_TEST_PRESET", "from-env");

    EXPECT_EQ(LoadEnvFile(path.string()), 2);
    EXPECT_EQ(GetEnvOrDefault("AUTHGATE_TEST_FROM_FILE", ""), "plain");
    EXPECT_EQ(GetEnvOrDefault("AUTHGATE_TEST_QUOTED", ""), "with spaces");
    EXPECT_EQ(GetEnvOrDefault("AUTHGATE_TEST_PRESET", ""), "from-env");

    std::filesystem::remove(path);
    EXPECT_EQ(LoadEnvFile(path.string()), -1);
}

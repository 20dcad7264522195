//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example HTTP server protecting routes with API keys, Basic auth and JWT bearer tokens
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "authgate/HTTPServer.hpp"
#include "authgate/JSONValue.h"
#include "authgate/version.h"
#include "authgate/auth/AuthorizationPipeline.hpp"
#include "authgate/auth/CredentialStore.hpp"
#include "authgate/auth/KeySetCache.hpp"
#include "authgate/auth/KeySetSource.hpp"
#include "authgate/config/AuthConfig.hpp"

using namespace authgate;
namespace net = boost::asio;
namespace http = boost::beast::http;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--port")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static RouteResponse jsonOk(JSONValue::Object body) {
    return RouteResponse{200, serializeJSONValue(JSONValue(std::move(body))), "application/json"};
}

// Runs the initial key-set fetch to completion; failure ends startup.
static std::shared_ptr<auth::KeySetCache> loadKeySet(const config::AuthConfig& cfg, bool discover) {
    net::io_context ioc;
    auth::HttpFetchParams params;
    params.url = cfg.jwksUri;
    if (params.url.empty() && discover) {
        auth::HttpFetchParams discovery;
        discovery.url = cfg.jwtIssuer;
        auto uri = net::co_spawn(ioc, auth::discoverJwksUri(discovery), net::use_future);
        ioc.run();
        params.url = uri.get();
        ioc.restart();
    }
    auth::KeySetCache::Options opts;
    opts.timeToLive = cfg.jwksTtl;
    auto source = std::make_shared<auth::HttpKeySetSource>(params);
    auto fut = net::co_spawn(ioc, auth::KeySetCache::Create(source, opts), net::use_future);
    ioc.run();
    return fut.get();
}

int main(int argc, char** argv) {
    if (auto envFile = getArgValue(argc, argv, "--env-file")) {
        int n = LoadEnvFile(*envFile);
        if (n < 0) {
            std::cerr << "Cannot read env file " << *envFile << std::endl;
            return 2;
        }
    }

    config::AuthConfig cfg;
    try {
        cfg = config::AuthConfig::FromEnvironment();
    } catch (const config::ConfigError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }
    Logger::setLogLevel(cfg.logLevel);
    if (auto logFile = getArgValue(argc, argv, "--log-file")) {
        Logger::setLogFile(*logFile);
    }
    LOG_INFO("authgate {} starting (verbosity={})", getVersionString(), errors::verbosityName(cfg.verbosity));

    auto store = std::make_shared<auth::StaticCredentialStore>(cfg.apiKeys, cfg.basicUsers);
    LOG_INFO("Loaded {} API keys and {} Basic users", store->ApiKeyCount(), store->UserCount());

    const bool discover = hasFlag(argc, argv, "--discover-jwks");
    std::shared_ptr<auth::KeySetCache> keys;
    if (!cfg.jwksUri.empty() || (discover && !cfg.jwtIssuer.empty())) {
        try {
            keys = loadKeySet(cfg, discover);
        } catch (const std::exception& e) {
            LOG_ERROR("Cannot load JWKS: {}", e.what());
            return 1;
        }
    } else {
        LOG_WARN("AUTHGATE_JWKS_URI not set; bearer-protected routes will answer with an internal error");
    }

    auth::PipelineOptions popts;
    popts.apiKeyHeader = cfg.apiKeyHeader;
    popts.jwt = cfg.JwtOptions();
    auto pipeline = std::make_shared<const auth::AuthorizationPipeline>(store, keys, popts);

    HTTPServer::Options sopts;
    sopts.address = getArgValue(argc, argv, "--address").value_or("127.0.0.1");
    sopts.port = getArgValue(argc, argv, "--port").value_or("8080");
    sopts.scheme = getArgValue(argc, argv, "--scheme").value_or("http");
    sopts.certFile = getArgValue(argc, argv, "--cert").value_or("");
    sopts.keyFile = getArgValue(argc, argv, "--key").value_or("");
    sopts.verbosity = cfg.verbosity;
    sopts.render.realm = cfg.realm;

    std::unique_ptr<HTTPServer> server;
    try {
        server = std::make_unique<HTTPServer>(sopts, pipeline);
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot create server: {}", e.what());
        return 1;
    }

    server->AddRoute(Route{"/health", http::verb::get, AuthRequirement::None, {}, [](const RouteContext&) {
        JSONValue::Object o;
        o["status"] = std::make_shared<JSONValue>("ok");
        o["version"] = std::make_shared<JSONValue>(getVersionString());
        return jsonOk(std::move(o));
    }});

    server->AddRoute(Route{"/api-key", http::verb::get, AuthRequirement::ApiKey, {}, [](const RouteContext& ctx) {
        const auto& key = std::get<auth::ValidApiKey>(*ctx.principal);
        JSONValue::Object o;
        o["api_key"] = std::make_shared<JSONValue>(auth::maskSecret(key.value));
        return jsonOk(std::move(o));
    }});

    server->AddRoute(Route{"/api-key/optional", http::verb::get, AuthRequirement::None, {}, [pipeline](const RouteContext& ctx) {
        auto key = auth::optionalCredential(pipeline->AuthorizeApiKey(ctx.request));
        JSONValue::Object o;
        o["authenticated"] = std::make_shared<JSONValue>(key.has_value());
        if (key) {
            o["api_key"] = std::make_shared<JSONValue>(auth::maskSecret(key->value));
        }
        return jsonOk(std::move(o));
    }});

    server->AddRoute(Route{"/basic", http::verb::get, AuthRequirement::Basic, {}, [](const RouteContext& ctx) {
        const auto& user = std::get<auth::AuthenticatedUser>(*ctx.principal);
        JSONValue::Object o;
        o["username"] = std::make_shared<JSONValue>(user.username);
        return jsonOk(std::move(o));
    }});

    server->AddRoute(Route{"/jwt/claims", http::verb::get, AuthRequirement::Bearer, {}, [](const RouteContext& ctx) {
        const auto& claims = std::get<auth::ValidatedClaims<auth::OidcClaims>>(*ctx.principal);
        return RouteResponse{200, serializeJSONValue(claims->ToJSON()), "application/json"};
    }});

    server->AddRoute(Route{"/admin", http::verb::get, AuthRequirement::Bearer, {"admin"}, [](const RouteContext& ctx) {
        const auto& claims = std::get<auth::ValidatedClaims<auth::OidcClaims>>(*ctx.principal);
        JSONValue::Object o;
        o["message"] = std::make_shared<JSONValue>("Welcome, " + claims->sub);
        return jsonOk(std::move(o));
    }});

    try {
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot start server: {}", e.what());
        return 1;
    }

    net::io_context signals;
    net::signal_set set(signals, SIGINT, SIGTERM);
    set.async_wait([](const boost::system::error_code& ec, int sig) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", sig);
        }
    });
    signals.run();

    server->Stop().get();
    LOG_INFO("authgate stopped");
    return 0;
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/KeySetSource.cpp
// Purpose: HTTP key-set source and OpenID Provider discovery
//==========================================================================================================

#include <utility>

#include <boost/asio/use_awaitable.hpp>

#include "authgate/auth/KeySetSource.hpp"
#include "authgate/auth/KeySet.hpp"
#include "authgate/JSONValue.h"
#include "logging/Logger.h"

namespace authgate::auth {

namespace {
    const std::string kWellKnown = "/.well-known/openid-configuration";
}

HttpKeySetSource::HttpKeySetSource(HttpFetchParams p) : params(std::move(p)) {}

boost::asio::awaitable<std::string> HttpKeySetSource::FetchDocument() {
    co_return co_await coHttpGet(params);
}

std::string HttpKeySetSource::Describe() const {
    return params.url;
}

std::string openIdConfigurationUrl(const std::string& issuerOrConfigurationUrl) {
    std::string url = issuerOrConfigurationUrl;
    if (url.size() >= kWellKnown.size() &&
        url.compare(url.size() - kWellKnown.size(), kWellKnown.size(), kWellKnown) == 0) {
        return url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + kWellKnown;
}

boost::asio::awaitable<std::string> discoverJwksUri(HttpFetchParams params) {
    params.url = openIdConfigurationUrl(params.url);
    LOG_INFO("Discovering JWKS URI from {}", params.url);
    std::string document;
    try {
        document = co_await coHttpGet(params);
    } catch (const HttpFetchError& e) {
        throw KeySetError(std::string("Failed to fetch OpenID configuration: ") + e.what());
    }

    JSONValue root;
    try {
        root = parseJSON(document);
    } catch (const JSONParseError& e) {
        throw KeySetError(std::string("Failed to parse OpenID configuration: ") + e.what());
    }
    const JSONValue::Object* obj = asObject(root);
    std::optional<std::string> jwksUri = obj ? findString(*obj, "jwks_uri") : std::nullopt;
    if (!jwksUri.has_value() || jwksUri->empty()) {
        throw KeySetError("OpenID configuration at " + params.url + " has no jwks_uri");
    }
    LOG_INFO("Discovered JWKS URI {}", *jwksUri);
    co_return *jwksUri;
}

} // namespace authgate::auth

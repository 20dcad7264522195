//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeySetSource.hpp
// Purpose: Pluggable origin of JWKS documents (remote URI or in-process) and OpenID discovery
//==========================================================================================================

#pragma once

#include <string>

#include <boost/asio/awaitable.hpp>

#include "authgate/auth/HttpClient.hpp"

namespace authgate::auth {

//==========================================================================================================
// IKeySetSource
// Purpose: Produces the current JWKS document text.
//   FetchDocument: Suspends until the document is available; throws on any failure.
//   Describe: Human-readable origin used in logs and error messages.
//==========================================================================================================
class IKeySetSource {
public:
    virtual ~IKeySetSource() = default;
    virtual boost::asio::awaitable<std::string> FetchDocument() = 0;
    virtual std::string Describe() const = 0;
};

//==========================================================================================================
// HttpKeySetSource
// Purpose: Fetches the JWKS document with an HTTP(S) GET of a fixed URI.
//==========================================================================================================
class HttpKeySetSource : public IKeySetSource {
public:
    explicit HttpKeySetSource(HttpFetchParams params);

    boost::asio::awaitable<std::string> FetchDocument() override;
    std::string Describe() const override;

private:
    HttpFetchParams params;
};

//==========================================================================================================
// openIdConfigurationUrl
// Purpose: Returns the discovery document URL for an issuer. URLs already ending in
//          "/.well-known/openid-configuration" are returned unchanged.
//==========================================================================================================
std::string openIdConfigurationUrl(const std::string& issuerOrConfigurationUrl);

//==========================================================================================================
// discoverJwksUri
// Purpose: Fetches the OpenID Provider configuration and returns its "jwks_uri".
// Args:
//   params: params.url is the issuer or the configuration URL; transport settings are reused.
// Throws:
//   KeySetError when the document cannot be fetched, parsed, or has no jwks_uri.
//==========================================================================================================
boost::asio::awaitable<std::string> discoverJwksUri(HttpFetchParams params);

} // namespace authgate::auth

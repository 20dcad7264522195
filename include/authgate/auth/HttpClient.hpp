//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: Minimal coroutine HTTP(S) GET client used to fetch key sets and OpenID configuration
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>

namespace authgate::auth {

//==========================================================================================================
// HttpFetchParams
// Purpose: Target and transport settings for a single GET.
// Fields:
//   url: http:// or https:// URL (scheme defaults to http when omitted).
//   serverName: SNI / certificate host override; defaults to the URL host.
//   caFile, caPath: Trust anchors for https; system defaults when both are empty.
//   connectTimeoutMs, readTimeoutMs: Per-phase deadlines.
//==========================================================================================================
struct HttpFetchParams {
    std::string url;
    std::string serverName;
    std::string caFile;
    std::string caPath;
    unsigned int connectTimeoutMs{5000};
    unsigned int readTimeoutMs{10000};
};

// Thrown on malformed URLs, transport failures and non-2xx responses.
class HttpFetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// UrlParts
// Purpose: Components of an http(s) URL as used by coHttpGet.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

// Splits url into scheme/host/port/path-with-query. Throws HttpFetchError on unsupported schemes or empty host.
UrlParts parseUrl(const std::string& url);

//==========================================================================================================
// coHttpGet
// Purpose: Performs GET url with "Accept: application/json" and returns the response body.
// Args:
//   params: Target URL and transport settings.
//   sslCtxOpt: Optional TLS context for https; a verifying TLS >= 1.2 client context is created when null.
// Throws:
//   HttpFetchError (including for status codes outside 2xx).
//==========================================================================================================
boost::asio::awaitable<std::string> coHttpGet(const HttpFetchParams& params,
                                              boost::asio::ssl::context* sslCtxOpt = nullptr);

} // namespace authgate::auth

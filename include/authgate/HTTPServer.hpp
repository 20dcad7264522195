//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS server with per-route authentication using Boost.Beast
//          (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/beast/http.hpp>

#include "authgate/auth/AuthorizationPipeline.hpp"
#include "authgate/errors/AuthError.h"
#include "authgate/errors/ErrorResponse.h"

namespace authgate {

// Credential a route demands before its handler runs.
using AuthRequirement = errors::AuthScheme;

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using RoutePrincipal = auth::Principal<auth::OidcClaims>;

//==========================================================================================================
// RouteContext
// Purpose: What a handler sees: the request and, for protected routes, the verified principal.
//==========================================================================================================
struct RouteContext {
    const HttpRequest& request;
    std::optional<RoutePrincipal> principal;
};

//==========================================================================================================
// RouteResponse
// Purpose: Handler result. body is sent as-is with contentType.
//==========================================================================================================
struct RouteResponse {
    int status{200};
    std::string body;
    std::string contentType{"application/json"};
};

using RouteHandler = std::function<RouteResponse(const RouteContext&)>;

//==========================================================================================================
// Route
// Fields:
//   path: Exact request path (query string ignored).
//   method: HTTP method served.
//   auth: Credential required (None, ApiKey, Basic, Bearer).
//   requiredRoles: For Bearer routes, the principal must hold at least one of these roles.
//   handler: Invoked after successful authorization.
//==========================================================================================================
struct Route {
    std::string path;
    boost::beast::http::verb method{boost::beast::http::verb::get};
    AuthRequirement auth{AuthRequirement::None};
    std::vector<std::string> requiredRoles;
    RouteHandler handler;
};

class HTTPServer {
public:
    using ErrorHandler = std::function<void(const std::string&)>;

    //======================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, TLS files and error presentation.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see Port())
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   verbosity: Disclosure level for authentication errors
    //   render: Realm and other challenge settings
    //======================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        errors::ErrorVerbosity verbosity{errors::ErrorVerbosity::Full};
        errors::RenderOptions render;
    };

    HTTPServer(const Options& opts, std::shared_ptr<const auth::AuthorizationPipeline> pipeline);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    // Registers a route. Must be called before Start().
    void AddRoute(Route route);

    //======================================================================================================
    // Start
    // Purpose: Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the server is listening; holds the exception when the address
    //   cannot be resolved or bound.
    //======================================================================================================
    std::future<void> Start();

    // Closes the acceptor, stops the I/O context and joins the background thread.
    std::future<void> Stop();

    // Bound port after Start() (useful when Options::port is "0"); 0 before.
    unsigned short Port() const;

    // Callback for session/accept errors (also logged).
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace authgate

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/HTTPServer.cpp
// Purpose: HTTP/HTTPS server with per-route authentication using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <algorithm>
#include <cctype>
#include <mutex>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "authgate/JSONValue.h"
#include "authgate/HTTPServer.hpp"

#include <openssl/ssl.h>

namespace authgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;
using Response = http::response<http::string_body>;

namespace {
    std::string messageBody(const std::string& message) {
        JSONValue::Object o;
        o["message"] = std::make_shared<JSONValue>(message);
        return serializeJSONValue(JSONValue(std::move(o)));
    }

    std::string pathOf(const HttpRequest& req) {
        std::string target(req.target().data(), req.target().size());
        auto q = target.find('?');
        if (q != std::string::npos) {
            target.erase(q);
        }
        return target;
    }
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::shared_ptr<const auth::AuthorizationPipeline> pipeline;
    std::vector<Route> routes;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::mutex errorMutex;
    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, std::shared_ptr<const auth::AuthorizationPipeline> p)
        : opts(o), pipeline(std::move(p)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HTTPServer: unsupported scheme '" + opts.scheme + "'");
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        std::lock_guard<std::mutex> lock(errorMutex);
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionFailed(const char* what, const std::exception& e) {
        if (!running.load()) {
            // Shutdown-related errors (operation_aborted, closed sockets)
            LOG_DEBUG("HTTPServer {} suppressed during shutdown: {}", what, e.what());
        } else {
            setError(std::string("HTTPServer ") + what + " error: " + e.what());
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            HttpRequest req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = co_await makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFailed("plain session", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            HttpRequest req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = co_await makeResponse(req);
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionFailed("TLS session", e);
        }
        co_return;
    }

    Response jsonResponse(const HttpRequest& req, http::status status, std::string body) {
        Response res{status, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    Response errorResponse(const HttpRequest& req, const errors::AuthError& error) {
        errors::ErrorResponse rendered = errors::renderAuthError(error, opts.verbosity, opts.render);
        Response res{static_cast<http::status>(rendered.statusCode), req.version()};
        for (const auto& h : rendered.headers) {
            res.set(h.name, h.value);
        }
        res.keep_alive(false);
        res.body() = std::move(rendered.body);
        res.prepare_payload();
        return res;
    }

    net::awaitable<Response> makeResponse(const HttpRequest& req) {
        const std::string path = pathOf(req);

        const Route* route = nullptr;
        std::string allowed;
        for (const auto& r : routes) {
            if (r.path != path) {
                continue;
            }
            if (r.method == req.method()) {
                route = &r;
                break;
            }
            if (!allowed.empty()) allowed += ", ";
            allowed += std::string(http::to_string(r.method));
        }
        if (route == nullptr) {
            if (allowed.empty()) {
                LOG_DEBUG("HTTPServer: no route for {}", path);
                co_return jsonResponse(req, http::status::not_found, messageBody("Not found"));
            }
            auto res = jsonResponse(req, http::status::method_not_allowed, messageBody("Method not allowed"));
            res.set(http::field::allow, allowed);
            co_return res;
        }

        RouteContext ctx{req, std::nullopt};
        if (route->auth != AuthRequirement::None) {
            if (!pipeline) {
                co_return errorResponse(req, errors::internalError(route->auth, "no authorization pipeline configured"));
            }
            auto result = co_await pipeline->Authorize<auth::OidcClaims>(route->auth, req);
            if (!result) {
                co_return errorResponse(req, result.error());
            }
            if (route->auth == AuthRequirement::Bearer && !route->requiredRoles.empty()) {
                const auto& claims = std::get<auth::ValidatedClaims<auth::OidcClaims>>(result.value());
                auto denied = auth::requireAnyRole(claims->roles, route->requiredRoles);
                if (denied.has_value()) {
                    co_return errorResponse(req, *denied);
                }
            }
            ctx.principal = std::move(result).value();
        }

        RouteResponse out;
        try {
            out = route->handler ? route->handler(ctx) : RouteResponse{204, std::string(), std::string()};
        } catch (const std::exception& e) {
            setError(std::string("HTTPServer handler error on ") + path + ": " + e.what());
            co_return errorResponse(req, errors::internalError(route->auth, std::string("handler failed: ") + e.what()));
        }
        Response res{static_cast<http::status>(out.status), req.version()};
        if (!out.contentType.empty()) {
            res.set(http::field::content_type, out.contentType);
        }
        res.keep_alive(false);
        res.body() = std::move(out.body);
        res.prepare_payload();
        co_return res;
    }

    void bindListener() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() || opts.port.size() > 5 ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
            throw std::invalid_argument("HTTPServer invalid port: '" + opts.port + "'");
        }
        if (std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port (out of range): " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            sessionFailed("accept", e);
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, std::shared_ptr<const auth::AuthorizationPipeline> pipeline)
    : pImpl(std::make_unique<Impl>(opts, std::move(pipeline))) {}

HTTPServer::~HTTPServer() = default;

void HTTPServer::AddRoute(Route route) {
    if (!route.requiredRoles.empty() && route.auth != AuthRequirement::Bearer) {
        LOG_WARN("HTTPServer: route {} declares roles but does not use bearer authentication; roles ignored", route.path);
    }
    pImpl->routes.push_back(std::move(route));
}

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bindListener();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    LOG_INFO("HTTPServer listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.address, pImpl->boundPort.load());
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HTTPServer I/O loop error: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
        if (ec) {
            LOG_DEBUG("HTTPServer acceptor close: {}", ec.message());
        }
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

unsigned short HTTPServer::Port() const {
    return pImpl->boundPort.load();
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->errorMutex);
    pImpl->errorHandler = std::move(handler);
}

} // namespace authgate

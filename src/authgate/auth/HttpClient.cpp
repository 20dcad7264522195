//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/HttpClient.cpp
// Purpose: Coroutine HTTP(S) GET over Boost.Beast with OpenSSL peer verification
//==========================================================================================================

#include <string>
#include <utility>
#include <memory>
#include <chrono>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>
#include "authgate/auth/HttpClient.hpp"
#include "logging/Logger.h"

namespace authgate::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
        pos = 0;
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw HttpFetchError("unsupported URL scheme: " + parts.scheme);
    }
    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
        if (parts.path[0] == '?') {
            parts.path.insert(parts.path.begin(), '/');
        }
    }
    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (parts.host.empty() || parts.port.empty()) {
        throw HttpFetchError("invalid URL: " + url);
    }
    return parts;
}

namespace {
    http::request<http::empty_body> makeGet(const UrlParts& u, const std::string& hostHeader) {
        http::request<http::empty_body> req{http::verb::get, u.path, 11};
        req.set(http::field::host, hostHeader);
        req.set(http::field::user_agent, "authgate");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        return req;
    }

    std::string checkedBody(http::response<http::string_body>& res, const std::string& url) {
        const unsigned status = res.result_int();
        if (status < 200 || status >= 300) {
            throw HttpFetchError("GET " + url + " returned HTTP " + std::to_string(status));
        }
        return std::move(res.body());
    }

    std::unique_ptr<ssl::context> makeClientContext(const HttpFetchParams& params) {
        auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_2_VERSION);
        if (!params.caFile.empty()) {
            ctx->load_verify_file(params.caFile);
        }
        if (!params.caPath.empty()) {
            ctx->add_verify_path(params.caPath);
        }
        if (params.caFile.empty() && params.caPath.empty()) {
            ctx->set_default_verify_paths();
        }
        ctx->set_verify_mode(ssl::verify_peer);
        return ctx;
    }
}

net::awaitable<std::string> coHttpGet(const HttpFetchParams& params, ssl::context* sslCtxOpt) {
    try {
        UrlParts u = parseUrl(params.url);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
        LOG_DEBUG("HTTP GET resolved {}:{} path={}", u.host, u.port, u.path);

        if (u.scheme == std::string("https")) {
            ssl::context* ctxPtr = sslCtxOpt;
            std::unique_ptr<ssl::context> localCtx;
            if (!ctxPtr) {
                localCtx = makeClientContext(params);
                ctxPtr = localCtx.get();
            }
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *ctxPtr);
            std::string sni = params.serverName.empty() ? u.host : params.serverName;
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
                throw HttpFetchError("failed to set TLS SNI host name " + sni);
            }
            if (!::SSL_set1_host(stream.native_handle(), sni.c_str())) {
                throw HttpFetchError("failed to set TLS verification host name " + sni);
            }
            stream.next_layer().expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            LOG_DEBUG("HTTP GET https handshake complete with {}", sni);

            auto req = makeGet(u, sni);
            stream.next_layer().expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            LOG_DEBUG("HTTP GET https status={} bytes={}", res.result_int(), res.body().size());
            boost::system::error_code ec;
            stream.shutdown(ec);
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                LOG_DEBUG("HTTP GET TLS shutdown: {}", ec.message());
            }
            co_return checkedBody(res, params.url);
        } else {
            boost::beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(std::chrono::milliseconds(params.connectTimeoutMs));
            co_await stream.async_connect(results, net::use_awaitable);

            auto req = makeGet(u, u.port == "80" ? u.host : u.host + ":" + u.port);
            stream.expires_after(std::chrono::milliseconds(params.readTimeoutMs));
            co_await http::async_write(stream, req, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::response<http::string_body> res;
            co_await http::async_read(stream, buffer, res, net::use_awaitable);
            LOG_DEBUG("HTTP GET http status={} bytes={}", res.result_int(), res.body().size());
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != boost::beast::errc::not_connected) {
                LOG_DEBUG("HTTP GET socket shutdown: {}", ec.message());
            }
            co_return checkedBody(res, params.url);
        }
    } catch (const HttpFetchError&) {
        throw;
    } catch (const boost::system::system_error& e) {
        throw HttpFetchError("GET " + params.url + " failed: " + e.code().message());
    }
}

} // namespace authgate::auth

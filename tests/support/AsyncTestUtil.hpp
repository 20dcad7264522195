//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/AsyncTestUtil.hpp
// Purpose: Helpers to drive coroutine APIs to completion from synchronous GoogleTest bodies
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace authgate::test_support {

//==========================================================================================================
// runSync
// Purpose: Runs an awaitable on a private io_context and returns its result. Exceptions raised inside
//          the coroutine are rethrown to the caller. T need not be default-constructible.
//==========================================================================================================
template <typename T>
T runSync(boost::asio::awaitable<T> aw) {
    boost::asio::io_context ioc;
    std::optional<T> out;
    std::exception_ptr err;
    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        try {
            out.emplace(co_await std::move(aw));
        } catch (...) {
            err = std::current_exception();
        }
    }, boost::asio::detached);
    ioc.run();
    if (err) {
        std::rethrow_exception(err);
    }
    return std::move(*out);
}

inline void runSync(boost::asio::awaitable<void> aw) {
    boost::asio::io_context ioc;
    std::exception_ptr err;
    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        try {
            co_await std::move(aw);
        } catch (...) {
            err = std::current_exception();
        }
    }, boost::asio::detached);
    ioc.run();
    if (err) {
        std::rethrow_exception(err);
    }
}

} // namespace authgate::test_support

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/support/FakeKeySetSource.hpp
// Purpose: In-process key-set source, controllable clock and log capture for cache/pipeline tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "authgate/auth/KeySetSource.hpp"
#include "logging/Logger.h"

namespace authgate::test_support {

//==========================================================================================================
// FakeKeySetSource
// Purpose: Serves a settable document, or throws when failing is set. Counts fetches.
//==========================================================================================================
class FakeKeySetSource : public auth::IKeySetSource {
public:
    explicit FakeKeySetSource(std::string doc = std::string()) : document(std::move(doc)) {}

    boost::asio::awaitable<std::string> FetchDocument() override {
        fetches.fetch_add(1);
        std::string doc;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (failing) {
                throw std::runtime_error("connection refused");
            }
            doc = document;
        }
        co_return doc;
    }

    std::string Describe() const override { return "fake://jwks"; }

    void SetDocument(std::string doc) {
        std::lock_guard<std::mutex> lock(mutex);
        document = std::move(doc);
    }

    void SetFailing(bool f) {
        std::lock_guard<std::mutex> lock(mutex);
        failing = f;
    }

    int Fetches() const { return fetches.load(); }

private:
    mutable std::mutex mutex;
    std::string document;
    bool failing{false};
    std::atomic<int> fetches{0};
};

//==========================================================================================================
// ManualClock
// Purpose: steady_clock stand-in advanced explicitly by the test.
//==========================================================================================================
class ManualClock {
public:
    std::chrono::steady_clock::time_point Now() const {
        std::lock_guard<std::mutex> lock(mutex);
        return now;
    }

    void Advance(std::chrono::steady_clock::duration d) {
        std::lock_guard<std::mutex> lock(mutex);
        now += d;
    }

private:
    mutable std::mutex mutex;
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::now()};
};

//==========================================================================================================
// LogCapture
// Purpose: Records log messages for the lifetime of the object via Logger::setSink.
//==========================================================================================================
class LogCapture {
public:
    LogCapture() {
        Logger::setSink([this](const std::string& level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            records.emplace_back(level, message);
        });
    }

    ~LogCapture() { Logger::setSink(Logger::Sink()); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    // True when some record at level contains text.
    bool Contains(const std::string& level, const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& r : records) {
            if (r.first == level && r.second.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    bool ContainsText(const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& r : records) {
            if (r.second.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> records;
};

} // namespace authgate::test_support

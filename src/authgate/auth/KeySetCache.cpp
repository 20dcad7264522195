//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/KeySetCache.cpp
// Purpose: TTL cache of the verification key set
//==========================================================================================================

#include <mutex>
#include <utility>

#include "authgate/auth/KeySetCache.hpp"
#include "logging/Logger.h"

namespace authgate::auth {

KeySetCache::KeySetCache(std::shared_ptr<IKeySetSource> src, Options opts)
    : source(std::move(src)), options(std::move(opts)) {}

boost::asio::awaitable<std::shared_ptr<KeySetCache>> KeySetCache::Create(std::shared_ptr<IKeySetSource> source,
                                                                         Options options) {
    if (!source) {
        throw KeySetError("key set source is null");
    }
    std::shared_ptr<KeySetCache> cache(new KeySetCache(std::move(source), std::move(options)));
    auto snap = co_await cache->fetchSnapshot();
    LOG_INFO("Loaded JWKS from {} ({} keys, ttl={}s)", cache->Describe(), snap->keys.size(),
             cache->options.timeToLive.count());
    cache->install(std::move(snap));
    co_return cache;
}

KeySetCache::Clock::time_point KeySetCache::now() const {
    return options.clock ? options.clock() : Clock::now();
}

std::shared_ptr<const KeySetSnapshot> KeySetCache::Current() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return current;
}

void KeySetCache::install(std::shared_ptr<const KeySetSnapshot> snap) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    current = std::move(snap);
}

bool KeySetCache::IsStale() const {
    auto snap = Current();
    if (!snap) {
        return true;
    }
    // Whole seconds, matching the resolution the TTL is configured in
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now() - snap->fetchedAt);
    return elapsed > options.timeToLive;
}

std::string KeySetCache::Describe() const {
    return source->Describe();
}

boost::asio::awaitable<std::shared_ptr<const KeySetSnapshot>> KeySetCache::fetchSnapshot() {
    std::string document;
    try {
        document = co_await source->FetchDocument();
    } catch (const std::exception& e) {
        throw KeySetError(std::string("Failed to fetch JWKS from the JWKS URI: ") + e.what());
    }
    try {
        co_return std::make_shared<const KeySetSnapshot>(parseKeySet(document, now()));
    } catch (const KeySetError& e) {
        throw KeySetError(std::string("Failed to parse JWKS from the JWKS URI: ") + e.what());
    }
}

boost::asio::awaitable<void> KeySetCache::Refresh() {
    LOG_DEBUG("Refreshing JWKS from {}", Describe());
    auto fresh = co_await fetchSnapshot();
    LOG_INFO("Refreshed JWKS from {} ({} keys)", Describe(), fresh->keys.size());
    install(std::move(fresh));
}

boost::asio::awaitable<std::shared_ptr<const KeySetSnapshot>> KeySetCache::Snapshot() {
    if (!IsStale()) {
        co_return Current();
    }
    try {
        co_await Refresh();
    } catch (const KeySetError& e) {
        LOG_ERROR("Failed to refresh JWKS, serving cached key set: {}", e.what());
    }
    co_return Current();
}

} // namespace authgate::auth

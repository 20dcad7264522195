//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeySetCache.hpp
// Purpose: TTL cache of the verification key set with read-triggered refresh and stale fallback
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "authgate/auth/KeySet.hpp"
#include "authgate/auth/KeySetSource.hpp"

namespace authgate::auth {

//==========================================================================================================
// KeySetCache
// Purpose: Holds the current KeySetSnapshot. Readers call Snapshot(); when the snapshot is older than
//          the time-to-live a fetch is made outside any lock and the new snapshot is swapped in under an
//          exclusive lock. A failed refresh is logged and the previous snapshot keeps being served.
//          Concurrent stale readers may each start a refresh; the swaps are atomic so every reader sees
//          one complete snapshot.
//==========================================================================================================
class KeySetCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::chrono::seconds timeToLive{300};
        // Time source; steady_clock::now when empty.
        std::function<Clock::time_point()> clock;
    };

    //======================================================================================================
    // Create
    // Purpose: Performs the initial fetch and returns a ready cache.
    // Throws:
    //   KeySetError when the initial fetch or parse fails; there is no snapshot to fall back to.
    //======================================================================================================
    static boost::asio::awaitable<std::shared_ptr<KeySetCache>> Create(std::shared_ptr<IKeySetSource> source,
                                                                       Options options);

    // Current snapshot, refreshed first when stale. Never fails.
    boost::asio::awaitable<std::shared_ptr<const KeySetSnapshot>> Snapshot();

    // Current snapshot without any refresh attempt.
    std::shared_ptr<const KeySetSnapshot> Current() const;

    // Unconditional refresh. Throws KeySetError and leaves the current snapshot untouched on failure.
    boost::asio::awaitable<void> Refresh();

    bool IsStale() const;
    std::string Describe() const;

    KeySetCache(const KeySetCache&) = delete;
    KeySetCache& operator=(const KeySetCache&) = delete;

private:
    KeySetCache(std::shared_ptr<IKeySetSource> source, Options options);

    Clock::time_point now() const;
    boost::asio::awaitable<std::shared_ptr<const KeySetSnapshot>> fetchSnapshot();
    void install(std::shared_ptr<const KeySetSnapshot> snap);

    std::shared_ptr<IKeySetSource> source;
    Options options;
    mutable std::shared_mutex mutex;
    std::shared_ptr<const KeySetSnapshot> current;
};

} // namespace authgate::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_keyset_cache.cpp
// Purpose: GoogleTests for the key-set cache: initial load, TTL refresh, stale fallback and atomic swaps
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "authgate/auth/KeySetCache.hpp"
#include "support/AsyncTestUtil.hpp"
#include "support/FakeKeySetSource.hpp"

using namespace authgate;
using namespace authgate::auth;
using test_support::FakeKeySetSource;
using test_support::LogCapture;
using test_support::ManualClock;
using test_support::runSync;

namespace {

std::string docWithKids(std::initializer_list<const char*> kids) {
    std::string doc = "{\"keys\":[";
    bool first = true;
    for (const char* kid : kids) {
        if (!first) doc += ",";
        first = false;
        doc += std::string("{\"kty\":\"RSA\",\"kid\":\"") + kid + "\",\"alg\":\"RS256\",\"n\":\"AQAB\",\"e\":\"AQAB\"}";
    }
    doc += "]}";
    return doc;
}

KeySetCache::Options optionsWith(ManualClock& clock, std::chrono::seconds ttl) {
    KeySetCache::Options o;
    o.timeToLive = ttl;
    o.clock = [&clock]() { return clock.Now(); };
    return o;
}

} // namespace

TEST(KeySetCache, CreateLoadsInitialSnapshot) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"a", "b"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(300))));
    ASSERT_TRUE(cache);
    EXPECT_EQ(source->Fetches(), 1);
    auto snap = cache->Current();
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->keys.size(), 2u);
    EXPECT_EQ(snap->fetchedAt, clock.Now());
    EXPECT_FALSE(cache->IsStale());
    EXPECT_EQ(cache->Describe(), "fake://jwks");
}

TEST(KeySetCache, FreshSnapshotIsServedWithoutFetching) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"a"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(300))));
    clock.Advance(std::chrono::seconds(299));
    auto first = runSync(cache->Snapshot());
    auto second = runSync(cache->Snapshot());
    EXPECT_EQ(source->Fetches(), 1);
    EXPECT_EQ(first.get(), second.get());
}

TEST(KeySetCache, ElapsedEqualToTtlIsNotStale) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"a"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(60))));
    clock.Advance(std::chrono::seconds(60));
    EXPECT_FALSE(cache->IsStale());
    clock.Advance(std::chrono::seconds(1));
    EXPECT_TRUE(cache->IsStale());
}

TEST(KeySetCache, StalenessIsMeasuredInWholeSeconds) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"a"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(0))));
    clock.Advance(std::chrono::milliseconds(500));
    EXPECT_FALSE(cache->IsStale());
    runSync(cache->Snapshot());
    EXPECT_EQ(source->Fetches(), 1);

    clock.Advance(std::chrono::milliseconds(600));
    EXPECT_TRUE(cache->IsStale());
    runSync(cache->Snapshot());
    EXPECT_EQ(source->Fetches(), 2);
}

TEST(KeySetCache, StaleSnapshotIsRefreshedOnRead) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"old"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(300))));
    source->SetDocument(docWithKids({"new", "newer"}));
    clock.Advance(std::chrono::seconds(301));

    auto snap = runSync(cache->Snapshot());
    EXPECT_EQ(source->Fetches(), 2);
    EXPECT_EQ(snap->keys.size(), 2u);
    EXPECT_NE(snap->find("new"), nullptr);
    EXPECT_EQ(snap->find("old"), nullptr);
    EXPECT_EQ(snap->fetchedAt, clock.Now());
    EXPECT_FALSE(cache->IsStale());
}

TEST(KeySetCache, FailedRefreshServesPreviousSnapshotAndLogs) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"keep"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(300))));
    auto before = cache->Current();

    LogCapture logs;
    source->SetFailing(true);
    clock.Advance(std::chrono::seconds(400));
    std::shared_ptr<const KeySetSnapshot> snap;
    ASSERT_NO_THROW({ snap = runSync(cache->Snapshot()); });
    EXPECT_EQ(snap.get(), before.get());
    EXPECT_NE(snap->find("keep"), nullptr);
    EXPECT_EQ(source->Fetches(), 2);
    EXPECT_TRUE(logs.Contains("ERROR", "Failed to fetch JWKS from the JWKS URI: connection refused"));

    // Still stale: the next read tries again
    EXPECT_TRUE(cache->IsStale());
    runSync(cache->Snapshot());
    EXPECT_EQ(source->Fetches(), 3);

    source->SetFailing(false);
    source->SetDocument(docWithKids({"rotated"}));
    auto recovered = runSync(cache->Snapshot());
    EXPECT_NE(recovered->find("rotated"), nullptr);
}

TEST(KeySetCache, UnparsableRefreshServesPreviousSnapshot) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"keep"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(10))));
    LogCapture logs;
    source->SetDocument("<html>maintenance</html>");
    clock.Advance(std::chrono::seconds(11));
    auto snap = runSync(cache->Snapshot());
    EXPECT_NE(snap->find("keep"), nullptr);
    EXPECT_TRUE(logs.ContainsText("Failed to parse JWKS from the JWKS URI: "));
}

TEST(KeySetCache, ExplicitRefreshFailureThrowsAndKeepsSnapshot) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"keep"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(300))));
    auto before = cache->Current();
    source->SetFailing(true);
    EXPECT_THROW(runSync(cache->Refresh()), KeySetError);
    EXPECT_EQ(cache->Current().get(), before.get());
}

TEST(KeySetCache, InitialFetchFailureIsFatal) {
    auto source = std::make_shared<FakeKeySetSource>();
    source->SetFailing(true);
    try {
        runSync(KeySetCache::Create(source, KeySetCache::Options{}));
        FAIL() << "expected KeySetError";
    } catch (const KeySetError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to fetch JWKS from the JWKS URI: connection refused");
    }
}

TEST(KeySetCache, InitialParseFailureIsFatal) {
    auto source = std::make_shared<FakeKeySetSource>("{\"no_keys\":true}");
    try {
        runSync(KeySetCache::Create(source, KeySetCache::Options{}));
        FAIL() << "expected KeySetError";
    } catch (const KeySetError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to parse JWKS from the JWKS URI: ", 0), 0u);
    }
}

TEST(KeySetCache, NullSourceIsRejected) {
    EXPECT_THROW(runSync(KeySetCache::Create(nullptr, KeySetCache::Options{})), KeySetError);
}

TEST(KeySetCache, ConcurrentReadersNeverObserveAPartialSnapshot) {
    ManualClock clock;
    auto source = std::make_shared<FakeKeySetSource>(docWithKids({"a1", "a2"}));
    auto cache = runSync(KeySetCache::Create(source, optionsWith(clock, std::chrono::seconds(0))));

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                auto snap = cache->Current();
                const bool setA = snap->keys.size() == 2 && snap->find("a1") && snap->find("a2");
                const bool setB = snap->keys.size() == 3 && snap->find("b1") && snap->find("b2") && snap->find("b3");
                if (!setA && !setB) {
                    torn.fetch_add(1);
                }
                reads.fetch_add(1);
            }
        });
    }

    while (reads.load() == 0) {
        std::this_thread::yield();
    }
    for (int i = 0; i < 200; ++i) {
        source->SetDocument(i % 2 == 0 ? docWithKids({"b1", "b2", "b3"}) : docWithKids({"a1", "a2"}));
        clock.Advance(std::chrono::seconds(1));
        runSync(cache->Snapshot());
    }
    stop.store(true);
    for (auto& th : readers) {
        th.join();
    }
    EXPECT_EQ(torn.load(), 0);
    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(source->Fetches(), 201);
}

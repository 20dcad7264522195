//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_keyset.cpp
// Purpose: GoogleTests for JWKS document parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "authgate/auth/KeySet.hpp"

using namespace authgate::auth;

TEST(ParseKeySet, IndexesKeysByKid) {
    const std::string doc = R"({"keys":[
        {"kty":"RSA","kid":"k1","alg":"RS256","use":"sig","n":"AQAB","e":"AQAB"},
        {"kty":"EC","kid":"k2","crv":"P-256","x":"a","y":"b"}
    ]})";
    auto at = std::chrono::steady_clock::now();
    KeySetSnapshot snap = parseKeySet(doc, at);
    EXPECT_EQ(snap.keys.size(), 2u);
    EXPECT_EQ(snap.fetchedAt, at);
    const JsonWebKey* k1 = snap.find("k1");
    ASSERT_NE(k1, nullptr);
    EXPECT_EQ(k1->kty, "RSA");
    EXPECT_EQ(k1->alg, "RS256");
    EXPECT_EQ(k1->use, "sig");
    EXPECT_EQ(k1->n, "AQAB");
    const JsonWebKey* k2 = snap.find("k2");
    ASSERT_NE(k2, nullptr);
    EXPECT_EQ(k2->kty, "EC");
    EXPECT_TRUE(k2->n.empty());
    EXPECT_EQ(snap.find("k3"), nullptr);
}

TEST(ParseKeySet, SkipsEntriesWithoutKidAndNonObjects) {
    const std::string doc = R"({"keys":[{"kty":"RSA","n":"x","e":"y"}, 5, "str", {"kty":"RSA","kid":"ok"}]})";
    KeySetSnapshot snap = parseKeySet(doc);
    EXPECT_EQ(snap.keys.size(), 1u);
    EXPECT_NE(snap.find("ok"), nullptr);
}

TEST(ParseKeySet, FirstEntryWinsForDuplicateKids) {
    const std::string doc = R"({"keys":[{"kty":"RSA","kid":"d","alg":"RS256"},{"kty":"RSA","kid":"d","alg":"RS512"}]})";
    KeySetSnapshot snap = parseKeySet(doc);
    ASSERT_EQ(snap.keys.size(), 1u);
    EXPECT_EQ(snap.find("d")->alg, "RS256");
}

TEST(ParseKeySet, EmptyKeysArrayIsValid) {
    KeySetSnapshot snap = parseKeySet(R"({"keys":[]})");
    EXPECT_TRUE(snap.keys.empty());
}

TEST(ParseKeySet, RejectsInvalidDocuments) {
    EXPECT_THROW(parseKeySet("not json"), KeySetError);
    EXPECT_THROW(parseKeySet("[1,2,3]"), KeySetError);
    EXPECT_THROW(parseKeySet(R"({"keys":{}})"), KeySetError);
    EXPECT_THROW(parseKeySet(R"({"other":[]})"), KeySetError);
    try {
        parseKeySet(R"({"other":[]})");
        FAIL() << "expected KeySetError";
    } catch (const KeySetError& e) {
        EXPECT_NE(std::string(e.what()).find("keys"), std::string::npos);
    }
}

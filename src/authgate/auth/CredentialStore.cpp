//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/CredentialStore.cpp
// Purpose: In-memory allow-list with constant-time secret comparison
//==========================================================================================================

#include <utility>

#include <openssl/crypto.h>

#include "authgate/auth/CredentialStore.hpp"

namespace authgate::auth {

namespace {
    bool secretEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        return a.empty() || ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }
}

StaticCredentialStore::StaticCredentialStore(std::vector<std::string> keys,
                                             std::unordered_map<std::string, std::optional<std::string>> userMap)
    : apiKeys(std::move(keys)), users(std::move(userMap)) {}

bool StaticCredentialStore::IsValidApiKey(const std::string& key) const {
    bool found = false;
    for (const auto& k : apiKeys) {
        found = secretEquals(k, key) || found;
    }
    return found;
}

bool StaticCredentialStore::Authenticate(const std::string& username, const std::optional<std::string>& password) const {
    auto it = users.find(username);
    if (it == users.end()) {
        return false;
    }
    const auto& expected = it->second;
    if (!expected.has_value() || !password.has_value()) {
        return !expected.has_value() && !password.has_value();
    }
    return secretEquals(*expected, *password);
}

} // namespace authgate::auth

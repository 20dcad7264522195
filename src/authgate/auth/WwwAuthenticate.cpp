//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.cpp
// Purpose: Builder for HTTP WWW-Authenticate challenges (Basic per RFC 7617, Bearer per RFC 6750)
//==========================================================================================================

#include "authgate/auth/WwwAuthenticate.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace authgate::auth {

static std::string toLower(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

static std::string quote(const std::string& v) {
    std::string out;
    out.reserve(v.size() + 2);
    out.push_back('"');
    for (char c : v) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string buildWwwAuthenticate(const WwwAuthChallenge& challenge) {
    const std::string lower = toLower(challenge.scheme);
    std::string out;
    if (lower == "basic") {
        out = "Basic";
    } else if (lower == "bearer") {
        out = "Bearer";
    } else {
        out = challenge.scheme;
    }

    // Deterministic order: realm first, then the rest sorted by key
    std::vector<std::string> keys;
    keys.reserve(challenge.params.size());
    for (const auto& kv : challenge.params) {
        if (kv.first != "realm") {
            keys.push_back(kv.first);
        }
    }
    std::sort(keys.begin(), keys.end());
    auto realm = challenge.params.find("realm");
    if (realm != challenge.params.end()) {
        keys.insert(keys.begin(), realm->first);
    }

    bool first = true;
    for (const auto& k : keys) {
        out += first ? " " : ", ";
        first = false;
        out += k;
        out += '=';
        out += quote(challenge.params.at(k));
    }
    return out;
}

} // namespace authgate::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/KeySet.cpp
// Purpose: JWKS document parsing into KeySetSnapshot
//==========================================================================================================

#include "authgate/auth/KeySet.hpp"
#include "authgate/JSONValue.h"
#include "logging/Logger.h"

namespace authgate::auth {

const JsonWebKey* KeySetSnapshot::find(const std::string& kid) const {
    auto it = keys.find(kid);
    return it == keys.end() ? nullptr : &it->second;
}

KeySetSnapshot parseKeySet(const std::string& document, std::chrono::steady_clock::time_point fetchedAt) {
    JSONValue root;
    try {
        root = parseJSON(document);
    } catch (const JSONParseError& e) {
        throw KeySetError(std::string("invalid JSON: ") + e.what());
    }
    const JSONValue::Object* obj = asObject(root);
    if (obj == nullptr) {
        throw KeySetError("document is not a JSON object");
    }
    const JSONValue* keysVal = findMember(*obj, "keys");
    const JSONValue::Array* keys = keysVal ? std::get_if<JSONValue::Array>(&keysVal->value) : nullptr;
    if (keys == nullptr) {
        throw KeySetError("missing \"keys\" array");
    }

    KeySetSnapshot snap;
    snap.fetchedAt = fetchedAt;
    size_t index = 0;
    for (const auto& entry : *keys) {
        const JSONValue::Object* k = entry ? asObject(*entry) : nullptr;
        if (k == nullptr) {
            LOG_WARN("JWKS entry {} is not an object; skipped", index);
            ++index;
            continue;
        }
        JsonWebKey jwk;
        jwk.kid = findString(*k, "kid").value_or("");
        jwk.kty = findString(*k, "kty").value_or("");
        jwk.alg = findString(*k, "alg").value_or("");
        jwk.use = findString(*k, "use").value_or("");
        jwk.n = findString(*k, "n").value_or("");
        jwk.e = findString(*k, "e").value_or("");
        if (jwk.kid.empty()) {
            LOG_WARN("JWKS entry {} (kty={}) has no kid; skipped", index, jwk.kty);
            ++index;
            continue;
        }
        if (snap.keys.find(jwk.kid) != snap.keys.end()) {
            LOG_WARN("JWKS entry {} repeats kid '{}'; first entry kept", index, jwk.kid);
            ++index;
            continue;
        }
        std::string kid = jwk.kid;
        snap.keys.emplace(std::move(kid), std::move(jwk));
        ++index;
    }
    LOG_DEBUG("Parsed JWKS with {} usable keys", snap.keys.size());
    return snap;
}

} // namespace authgate::auth

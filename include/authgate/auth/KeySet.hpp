//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeySet.hpp
// Purpose: JSON Web Key Set model (RFC 7517) and the immutable snapshot served by KeySetCache
//==========================================================================================================

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace authgate::auth {

//==========================================================================================================
// JsonWebKey
// Purpose: Public key entry of a key set. Numeric parameters stay base64url-encoded until a verifier
//          builds the key from them.
// Fields:
//   kid: Key id (never empty inside a KeySetSnapshot).
//   kty: Key family ("RSA", "EC", "oct", ...).
//   alg: Declared signing algorithm; may be empty.
//   use: Intended use ("sig"); may be empty.
//   n, e: RSA modulus and public exponent (base64url, unpadded). Empty for other families.
//==========================================================================================================
struct JsonWebKey {
    std::string kid;
    std::string kty;
    std::string alg;
    std::string use;
    std::string n;
    std::string e;
};

//==========================================================================================================
// KeySetSnapshot
// Purpose: Immutable mapping kid -> JsonWebKey together with the time it was fetched.
//==========================================================================================================
struct KeySetSnapshot {
    std::unordered_map<std::string, JsonWebKey> keys;
    std::chrono::steady_clock::time_point fetchedAt{};

    // Returns the key with the given id, or nullptr.
    const JsonWebKey* find(const std::string& kid) const;
};

// Thrown when a key set cannot be fetched or parsed.
class KeySetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// parseKeySet
// Purpose: Parses a JWKS document {"keys":[...]}. Entries without a "kid" cannot be selected by a token
//          and are skipped with a warning; for duplicate kids the first entry wins.
// Args:
//   document: JWKS JSON text.
//   fetchedAt: Timestamp recorded in the snapshot.
// Throws:
//   KeySetError when the document is not JSON, not an object or has no "keys" array.
//==========================================================================================================
KeySetSnapshot parseKeySet(const std::string& document,
                           std::chrono::steady_clock::time_point fetchedAt = std::chrono::steady_clock::now());

} // namespace authgate::auth

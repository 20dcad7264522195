//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/JwtVerifier.cpp
// Purpose: RSA JWT verification with OpenSSL 3 EVP, claim checks and failure classification
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/rsa.h>

#include "authgate/auth/JwtVerifier.hpp"
#include "authgate/auth/Base64.hpp"
#include "logging/Logger.h"

namespace authgate::auth {

namespace {
    struct BnFree { void operator()(BIGNUM* p) const { ::BN_free(p); } };
    struct ParamBldFree { void operator()(OSSL_PARAM_BLD* p) const { ::OSSL_PARAM_BLD_free(p); } };
    struct ParamFree { void operator()(OSSL_PARAM* p) const { ::OSSL_PARAM_free(p); } };
    struct PkeyCtxFree { void operator()(EVP_PKEY_CTX* p) const { ::EVP_PKEY_CTX_free(p); } };
    struct PkeyFree { void operator()(EVP_PKEY* p) const { ::EVP_PKEY_free(p); } };
    struct MdCtxFree { void operator()(EVP_MD_CTX* p) const { ::EVP_MD_CTX_free(p); } };

    using BnPtr = std::unique_ptr<BIGNUM, BnFree>;
    using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyFree>;

    std::string opensslError() {
        unsigned long code = ::ERR_get_error();
        ::ERR_clear_error();
        if (code == 0) {
            return std::string("unknown OpenSSL error");
        }
        char buf[256];
        ::ERR_error_string_n(code, buf, sizeof(buf));
        return std::string(buf);
    }

    [[noreturn]] void fail(JwtFailure failure, const std::string& message) {
        throw JwtValidationError(failure, message);
    }

    JSONValue decodeSegmentJSON(const std::string& segment, const char* what) {
        auto bytes = base64UrlDecode(segment);
        if (!bytes.has_value()) {
            fail(JwtFailure::MalformedToken, std::string(what) + " is not valid base64url");
        }
        JSONValue v;
        try {
            v = parseJSON(*bytes);
        } catch (const JSONParseError& e) {
            fail(JwtFailure::MalformedToken, std::string(what) + " is not valid JSON: " + e.what());
        }
        if (asObject(v) == nullptr) {
            fail(JwtFailure::MalformedToken, std::string(what) + " is not a JSON object");
        }
        return v;
    }

    struct TokenParts {
        std::string header;
        std::string payload;
        std::string signature;
    };

    TokenParts splitToken(const std::string& token) {
        auto d1 = token.find('.');
        auto d2 = (d1 == std::string::npos) ? std::string::npos : token.find('.', d1 + 1);
        if (d1 == std::string::npos || d2 == std::string::npos || token.find('.', d2 + 1) != std::string::npos) {
            fail(JwtFailure::MalformedToken, "token is not in JWS compact form (header.payload.signature)");
        }
        TokenParts p;
        p.header = token.substr(0, d1);
        p.payload = token.substr(d1 + 1, d2 - d1 - 1);
        p.signature = token.substr(d2 + 1);
        return p;
    }

    BnPtr decodeBigNum(const std::string& b64url, const char* what) {
        auto raw = base64UrlDecode(b64url);
        if (!raw.has_value() || raw->empty()) {
            fail(JwtFailure::InvalidKey, std::string("key parameter '") + what + "' is missing or not base64url");
        }
        BnPtr bn(::BN_bin2bn(reinterpret_cast<const unsigned char*>(raw->data()), static_cast<int>(raw->size()), nullptr));
        if (!bn) {
            fail(JwtFailure::InvalidKey, std::string("key parameter '") + what + "': " + opensslError());
        }
        return bn;
    }

    PkeyPtr buildRsaPublicKey(const JsonWebKey& jwk) {
        BnPtr n = decodeBigNum(jwk.n, "n");
        BnPtr e = decodeBigNum(jwk.e, "e");

        std::unique_ptr<OSSL_PARAM_BLD, ParamBldFree> bld(::OSSL_PARAM_BLD_new());
        if (!bld ||
            ::OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) != 1 ||
            ::OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get()) != 1) {
            fail(JwtFailure::InvalidKey, "failed to build RSA parameters: " + opensslError());
        }
        std::unique_ptr<OSSL_PARAM, ParamFree> params(::OSSL_PARAM_BLD_to_param(bld.get()));
        std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree> ctx(::EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
        if (!params || !ctx || ::EVP_PKEY_fromdata_init(ctx.get()) != 1) {
            fail(JwtFailure::InvalidKey, "failed to initialize RSA key import: " + opensslError());
        }
        EVP_PKEY* raw = nullptr;
        if (::EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params.get()) != 1 || raw == nullptr) {
            fail(JwtFailure::InvalidKey, "failed to import RSA key: " + opensslError());
        }
        return PkeyPtr(raw);
    }

    const EVP_MD* digestFor(JwtAlgorithm alg) {
        switch (alg) {
            case JwtAlgorithm::RS256:
            case JwtAlgorithm::PS256: return ::EVP_sha256();
            case JwtAlgorithm::RS384:
            case JwtAlgorithm::PS384: return ::EVP_sha384();
            case JwtAlgorithm::RS512:
            case JwtAlgorithm::PS512: return ::EVP_sha512();
        }
        return ::EVP_sha256();
    }

    bool isPss(JwtAlgorithm alg) {
        return alg == JwtAlgorithm::PS256 || alg == JwtAlgorithm::PS384 || alg == JwtAlgorithm::PS512;
    }

    void verifySignature(EVP_PKEY* key, JwtAlgorithm alg, const std::string& signingInput, const std::string& signature) {
        std::unique_ptr<EVP_MD_CTX, MdCtxFree> md(::EVP_MD_CTX_new());
        EVP_PKEY_CTX* pctx = nullptr; // owned by md
        if (!md || ::EVP_DigestVerifyInit(md.get(), &pctx, digestFor(alg), nullptr, key) != 1) {
            fail(JwtFailure::InvalidKey, "failed to initialize signature verification: " + opensslError());
        }
        if (isPss(alg)) {
            if (::EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
                ::EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) != 1) {
                fail(JwtFailure::InvalidKey, "failed to configure RSA-PSS: " + opensslError());
            }
        }
        int rc = ::EVP_DigestVerify(md.get(),
                                    reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                                    reinterpret_cast<const unsigned char*>(signingInput.data()), signingInput.size());
        if (rc != 1) {
            ::ERR_clear_error();
            fail(JwtFailure::InvalidSignature, "signature verification failed");
        }
    }

    bool intersects(const std::vector<std::string>& a, const std::vector<std::string>& b) {
        for (const auto& x : a) {
            if (std::find(b.begin(), b.end(), x) != b.end()) {
                return true;
            }
        }
        return false;
    }

    std::optional<int64_t> numericClaim(const JSONValue::Object& claims, const std::string& name) {
        const JSONValue* v = findMember(claims, name);
        if (v == nullptr) {
            return std::nullopt;
        }
        auto n = findInt64(claims, name);
        if (n.has_value()) {
            return n;
        }
        // Numeric dates beyond the int64 range saturate instead of being rejected
        if (const auto* d = std::get_if<double>(&v->value); d != nullptr && !std::isnan(*d)) {
            return *d > 0 ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
        }
        fail(JwtFailure::MalformedToken, "claim '" + name + "' is not a number");
        return std::nullopt;
    }

    void checkClaims(const JSONValue::Object& claims, const JwtValidationOptions& checks) {
        const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        const int64_t leeway = checks.leeway.count();

        auto exp = numericClaim(claims, "exp");
        if (!exp.has_value()) {
            fail(JwtFailure::MissingRequiredClaim, "missing required claim 'exp'");
        }
        if (*exp < now - leeway) {
            fail(JwtFailure::ExpiredSignature, "token expired at " + std::to_string(*exp));
        }

        if (checks.validateNotBefore) {
            auto nbf = numericClaim(claims, "nbf");
            if (nbf.has_value() && *nbf > now + leeway) {
                fail(JwtFailure::ImmatureSignature, "token not valid before " + std::to_string(*nbf));
            }
        }

        if (!checks.issuers.empty()) {
            auto iss = findString(claims, "iss");
            if (!iss.has_value()) {
                fail(JwtFailure::MissingRequiredClaim, "missing required claim 'iss'");
            }
            if (std::find(checks.issuers.begin(), checks.issuers.end(), *iss) == checks.issuers.end()) {
                fail(JwtFailure::InvalidIssuer, "token issuer '" + *iss + "' is not accepted");
            }
        }

        if (!checks.audiences.empty()) {
            auto aud = findStringList(claims, "aud");
            if (!aud.has_value()) {
                fail(JwtFailure::MissingRequiredClaim, "missing required claim 'aud'");
            }
            if (!intersects(*aud, checks.audiences)) {
                fail(JwtFailure::InvalidAudience, "token audience does not match any accepted audience");
            }
        }
    }
}

const char* algorithmName(JwtAlgorithm alg) noexcept {
    switch (alg) {
        case JwtAlgorithm::RS256: return "RS256";
        case JwtAlgorithm::RS384: return "RS384";
        case JwtAlgorithm::RS512: return "RS512";
        case JwtAlgorithm::PS256: return "PS256";
        case JwtAlgorithm::PS384: return "PS384";
        case JwtAlgorithm::PS512: return "PS512";
    }
    return "RS256";
}

std::optional<JwtAlgorithm> algorithmFromName(std::string_view name) {
    if (name == "RS256") return JwtAlgorithm::RS256;
    if (name == "RS384") return JwtAlgorithm::RS384;
    if (name == "RS512") return JwtAlgorithm::RS512;
    if (name == "PS256") return JwtAlgorithm::PS256;
    if (name == "PS384") return JwtAlgorithm::PS384;
    if (name == "PS512") return JwtAlgorithm::PS512;
    return std::nullopt;
}

const char* failureName(JwtFailure failure) noexcept {
    switch (failure) {
        case JwtFailure::MalformedToken: return "MalformedToken";
        case JwtFailure::MissingKeyId: return "MissingKeyId";
        case JwtFailure::UnknownKeyId: return "UnknownKeyId";
        case JwtFailure::UnsupportedKeyType: return "UnsupportedKeyType";
        case JwtFailure::InvalidKey: return "InvalidKey";
        case JwtFailure::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case JwtFailure::AlgorithmMismatch: return "AlgorithmMismatch";
        case JwtFailure::InvalidSignature: return "InvalidSignature";
        case JwtFailure::MissingRequiredClaim: return "MissingRequiredClaim";
        case JwtFailure::ExpiredSignature: return "ExpiredSignature";
        case JwtFailure::ImmatureSignature: return "ImmatureSignature";
        case JwtFailure::InvalidIssuer: return "InvalidIssuer";
        case JwtFailure::InvalidAudience: return "InvalidAudience";
    }
    return "MalformedToken";
}

JwtHeader decodeJwtHeader(const std::string& token) {
    TokenParts parts = splitToken(token);
    JSONValue header = decodeSegmentJSON(parts.header, "token header");
    const JSONValue::Object& obj = *asObject(header);
    JwtHeader h;
    h.alg = findString(obj, "alg").value_or("");
    h.kid = findString(obj, "kid").value_or("");
    h.typ = findString(obj, "typ").value_or("");
    return h;
}

JwtVerifier::JwtVerifier(JwtValidationOptions opts) : options(std::move(opts)) {}

JSONValue JwtVerifier::VerifyToken(const std::string& token, const KeySetSnapshot& keys) const {
    return VerifyToken(token, keys, options);
}

JSONValue JwtVerifier::VerifyToken(const std::string& token, const KeySetSnapshot& keys,
                                   const JwtValidationOptions& checks) const {
    JwtHeader header = decodeJwtHeader(token);
    if (header.kid.empty()) {
        fail(JwtFailure::MissingKeyId, "token header has no 'kid'");
    }

    const JsonWebKey* jwk = keys.find(header.kid);
    if (jwk == nullptr) {
        fail(JwtFailure::UnknownKeyId, "no key with kid '" + header.kid + "' in the key set");
    }
    if (jwk->kty != "RSA") {
        fail(JwtFailure::UnsupportedKeyType, "key '" + header.kid + "' has unsupported type '" + jwk->kty + "'");
    }

    PkeyPtr key = buildRsaPublicKey(*jwk);

    auto alg = algorithmFromName(jwk->alg);
    if (!alg.has_value()) {
        fail(JwtFailure::UnsupportedAlgorithm, "key '" + header.kid + "' declares unsupported algorithm '" + jwk->alg + "'");
    }
    if (header.alg != algorithmName(*alg)) {
        fail(JwtFailure::AlgorithmMismatch, "token algorithm '" + header.alg + "' does not match key algorithm '" + jwk->alg + "'");
    }

    TokenParts parts = splitToken(token);
    auto signature = base64UrlDecode(parts.signature);
    if (!signature.has_value()) {
        fail(JwtFailure::MalformedToken, "token signature is not valid base64url");
    }
    verifySignature(key.get(), *alg, parts.header + "." + parts.payload, *signature);

    JSONValue payload = decodeSegmentJSON(parts.payload, "token payload");
    checkClaims(*asObject(payload), checks);
    LOG_DEBUG("JWT verified (kid={}, alg={})", header.kid, header.alg);
    return payload;
}

errors::AuthError JwtVerifier::classify(const JwtValidationError& e) {
    if (e.IsExpired()) {
        return errors::tokenExpired(e.what());
    }
    return errors::tokenInvalid(std::string(failureName(e.Failure())) + ": " + e.what());
}

errors::AuthError JwtVerifier::claimsFailure(const std::exception& e) {
    return errors::internalError(errors::AuthScheme::Bearer, std::string("Failed to deserialize JWT claims: ") + e.what());
}

OidcClaims OidcClaims::FromJSON(const JSONValue& payload) {
    const JSONValue::Object* obj = asObject(payload);
    if (obj == nullptr) {
        throw ClaimsError("claims are not a JSON object");
    }
    OidcClaims c;
    auto sub = findString(*obj, "sub");
    if (!sub.has_value()) {
        throw ClaimsError("missing field 'sub'");
    }
    c.sub = *sub;
    c.iss = findString(*obj, "iss");
    c.audiences = findStringList(*obj, "aud").value_or(std::vector<std::string>{});
    c.exp = findInt64(*obj, "exp");
    c.iat = findInt64(*obj, "iat");
    c.emailVerified = findBool(*obj, "email_verified");
    c.name = findString(*obj, "name");
    c.preferredUsername = findString(*obj, "preferred_username");
    c.givenName = findString(*obj, "given_name");
    c.familyName = findString(*obj, "family_name");
    c.email = findString(*obj, "email");

    c.roles = findStringList(*obj, "roles").value_or(std::vector<std::string>{});
    if (const JSONValue* realm = findMember(*obj, "realm_access")) {
        if (const JSONValue::Object* ra = asObject(*realm)) {
            for (auto& r : findStringList(*ra, "roles").value_or(std::vector<std::string>{})) {
                if (std::find(c.roles.begin(), c.roles.end(), r) == c.roles.end()) {
                    c.roles.push_back(std::move(r));
                }
            }
        }
    }
    return c;
}

JSONValue OidcClaims::ToJSON() const {
    JSONValue::Object o;
    o["sub"] = std::make_shared<JSONValue>(sub);
    if (iss) o["iss"] = std::make_shared<JSONValue>(*iss);
    if (!audiences.empty()) {
        JSONValue::Array arr;
        for (const auto& a : audiences) arr.push_back(std::make_shared<JSONValue>(a));
        o["aud"] = std::make_shared<JSONValue>(std::move(arr));
    }
    if (exp) o["exp"] = std::make_shared<JSONValue>(*exp);
    if (iat) o["iat"] = std::make_shared<JSONValue>(*iat);
    if (emailVerified) o["email_verified"] = std::make_shared<JSONValue>(*emailVerified);
    if (name) o["name"] = std::make_shared<JSONValue>(*name);
    if (preferredUsername) o["preferred_username"] = std::make_shared<JSONValue>(*preferredUsername);
    if (givenName) o["given_name"] = std::make_shared<JSONValue>(*givenName);
    if (familyName) o["family_name"] = std::make_shared<JSONValue>(*familyName);
    if (email) o["email"] = std::make_shared<JSONValue>(*email);
    if (!roles.empty()) {
        JSONValue::Array arr;
        for (const auto& r : roles) arr.push_back(std::make_shared<JSONValue>(r));
        o["roles"] = std::make_shared<JSONValue>(std::move(arr));
    }
    return JSONValue(std::move(o));
}

std::optional<errors::AuthError> requireAnyRole(const std::vector<std::string>& have,
                                                const std::vector<std::string>& allowed,
                                                errors::AuthScheme scheme) {
    if (allowed.empty() || intersects(have, allowed)) {
        return std::nullopt;
    }
    std::string wanted;
    for (const auto& r : allowed) {
        if (!wanted.empty()) wanted += ", ";
        wanted += r;
    }
    return errors::insufficientRole(scheme, "requires one of the roles: " + wanted);
}

} // namespace authgate::auth

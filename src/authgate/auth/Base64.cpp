//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/authgate/auth/Base64.cpp
// Purpose: Strict base64 / base64url codecs on top of OpenSSL EVP block coders, and UTF-8 validation
//==========================================================================================================

#include <openssl/evp.h>

#include "authgate/auth/Base64.hpp"

namespace authgate::auth {

namespace {
    bool isStdAlphabet(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

    std::string encodeBlock(std::string_view in) {
        if (in.empty()) {
            return std::string();
        }
        std::string out(4 * ((in.size() + 2) / 3), '\0');
        int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
        out.resize(n > 0 ? static_cast<size_t>(n) : 0);
        return out;
    }
}

std::optional<std::string> base64Decode(std::string_view in) {
    if (in.empty()) {
        return std::string();
    }
    if (in.size() % 4 != 0) {
        return std::nullopt;
    }
    size_t pad = 0;
    if (in[in.size() - 1] == '=') {
        pad = (in[in.size() - 2] == '=') ? 2 : 1;
    }
    for (size_t i = 0; i < in.size() - pad; ++i) {
        if (!isStdAlphabet(in[i])) {
            return std::nullopt;
        }
    }

    std::string out(3 * (in.size() / 4), '\0');
    int n = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              reinterpret_cast<const unsigned char*>(in.data()),
                              static_cast<int>(in.size()));
    if (n < 0 || static_cast<size_t>(n) < pad) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(n) - pad);

    // Reject non-zero trailing bits by requiring the canonical encoding
    if (encodeBlock(out) != in) {
        return std::nullopt;
    }
    return out;
}

std::string base64Encode(std::string_view in) {
    return encodeBlock(in);
}

std::optional<std::string> base64UrlDecode(std::string_view in) {
    if (in.size() % 4 == 1) {
        return std::nullopt;
    }
    std::string std64;
    std64.reserve(in.size() + 3);
    for (char c : in) {
        if (c == '-') {
            std64.push_back('+');
        } else if (c == '_') {
            std64.push_back('/');
        } else if (c == '+' || c == '/' || c == '=') {
            return std::nullopt;
        } else {
            std64.push_back(c);
        }
    }
    while (std64.size() % 4 != 0) {
        std64.push_back('=');
    }
    return base64Decode(std64);
}

std::string base64UrlEncode(std::string_view in) {
    std::string out = encodeBlock(in);
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

bool isValidUtf8(std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }
        size_t len = 0;
        unsigned int cp = 0;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2; cp = c & 0x1F;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3; cp = c & 0x0F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4; cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false; // overlong
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace authgate::auth

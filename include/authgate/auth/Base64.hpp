//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.hpp
// Purpose: Strict base64 / base64url codecs (OpenSSL EVP block coders) and UTF-8 validation
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace authgate::auth {

//==========================================================================================================
// base64Decode
// Purpose: Decodes standard (RFC 4648 section 4) padded base64. Input must be canonical: length a
//          multiple of four, only the standard alphabet, '=' only as trailing padding and zero unused
//          bits in the final quantum. No whitespace is tolerated.
// Returns:
//   Decoded bytes, or std::nullopt when the input is not canonical base64.
//==========================================================================================================
std::optional<std::string> base64Decode(std::string_view in);

// Standard padded base64 encoding.
std::string base64Encode(std::string_view in);

//==========================================================================================================
// base64UrlDecode
// Purpose: Decodes unpadded base64url (RFC 4648 section 5) as used by JWS compact serialization and
//          JWK numeric parameters. '+', '/' and '=' are rejected.
//==========================================================================================================
std::optional<std::string> base64UrlDecode(std::string_view in);

// Unpadded base64url encoding.
std::string base64UrlEncode(std::string_view in);

// True when bytes form well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF).
bool isValidUtf8(std::string_view bytes);

} // namespace authgate::auth

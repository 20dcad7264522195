//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorResponse.h
// Purpose: Renders an AuthError into an HTTP response descriptor according to the verbosity policy
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "authgate/errors/AuthError.h"

namespace authgate {
namespace errors {

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// ErrorResponse
// Purpose: Transport-neutral response descriptor produced by renderAuthError.
// Fields:
//   statusCode: HTTP status (204 when verbosity is None).
//   headers: Headers to attach (Content-Type, WWW-Authenticate) in order.
//   body: Serialized JSON body, empty for None and StatusOnly.
//==========================================================================================================
struct ErrorResponse {
    int statusCode{500};
    std::vector<HeaderKV> headers;
    std::string body;

    // Returns the value of the first header matching name (case-insensitive), or empty.
    std::string header(const std::string& name) const;
};

//==========================================================================================================
// RenderOptions
// Purpose: Deployment-level presentation settings.
// Fields:
//   realm: When non-empty, added as realm="..." to WWW-Authenticate challenges.
//==========================================================================================================
struct RenderOptions {
    std::string realm;
};

//==========================================================================================================
// renderAuthError
// Purpose: Shapes an AuthError for the wire. Total over every (error, verbosity) pair.
//   None       -> 204, no body, no headers
//   StatusOnly -> status, no body
//   Message    -> status, {"message": summary}
//   TypeOnly   -> status, {"type": kind, "message": summary}
//   Full       -> status, {"type": kind, "message": summary, "detail": detail}
//   401/403 responses for Basic and Bearer carry a WWW-Authenticate challenge (except under None).
//==========================================================================================================
ErrorResponse renderAuthError(const AuthError& error, ErrorVerbosity verbosity, const RenderOptions& options = {});

} // namespace errors
} // namespace authgate

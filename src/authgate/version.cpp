//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "authgate/version.h"

#include <fmt/format.h>

namespace authgate {

VersionInfo getVersion() {
    return VersionInfo{0, 1, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace authgate

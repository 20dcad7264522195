//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for authgate (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace authgate {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
// Returns:
//   VersionInfo {major, minor, patch}
//==========================================================================================================
VersionInfo getVersion();

// Returns the version formatted as "MAJOR.MINOR.PATCH".
std::string getVersionString();

} // namespace authgate

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for mcplink (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcplink {

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
// Args:
//   (none)
// Returns:
//   VersionInfo {major, minor, patch}
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Args:
//   (none)
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

//==========================================================================================================
// getUserAgent
// Purpose: Identity announced to servers as clientInfo and as the HTTP User-Agent.
// Returns:
//   std::string formatted as "mcplink/MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getUserAgent();

// Product name used in clientInfo.name
constexpr const char* kClientName = "mcplink";

} // namespace mcplink

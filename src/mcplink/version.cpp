//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version and user-agent strings.
//==========================================================================================================
#include "mcplink/version.h"

#include <sstream>

namespace mcplink {

VersionInfo getVersion() {
    auto v = VersionInfo{1, 0, 0};
    return v;
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    auto s = oss.str();
    return s;
}

std::string getUserAgent() {
    return std::string(kClientName) + "/" + getVersionString();
}

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for toolhost (semantic version helpers and default client identity).
//==========================================================================================================
#pragma once

#include <string>

#include "toolhost/Protocol.h"

namespace toolhost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

//==========================================================================================================
// defaultClientInfo
// Purpose: clientInfo sent in initialize when the embedding application does not supply its own.
// Returns:
//   Implementation {"toolhost", getVersionString()}
//==========================================================================================================
Implementation defaultClientInfo();

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers and the default client identity.
//==========================================================================================================
#include "toolhost/version.h"

#include <format>

namespace toolhost {

VersionInfo getVersion() {
    return VersionInfo{0, 3, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

Implementation defaultClientInfo() {
    return Implementation{"toolhost", getVersionString()};
}

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read toolhost tuning knobs from the process environment.
//==========================================================================================================
#pragma once
#include <chrono>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set or empty.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvMillisOrDefault
// Purpose: Reads a non-negative millisecond duration from the environment.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset, empty, negative or not a number.
// Returns:
//   Parsed duration in milliseconds.
//==========================================================================================================
inline std::chrono::milliseconds GetEnvMillisOrDefault(const char* name, std::chrono::milliseconds defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    const long long parsed = std::strtoll(v.c_str(), &end, 10);
    if (end == v.c_str() || *end != '\0' || parsed < 0) {
        return defaultValue;
    }
    return std::chrono::milliseconds(parsed);
}

// Returns true for "1", "true", "TRUE", "yes" and "on".
inline bool GetEnvFlagOrDefault(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}

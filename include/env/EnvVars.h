//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables used for runtime configuration (log level, colors, files).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
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
// GetEnvFlag
// Purpose: Interprets "1", "true", "TRUE", "yes" as enabled.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE" || v == "yes");
}

//==========================================================================================================
// GetEnvUInt64OrDefault
// Purpose: Parses an unsigned integer environment variable; falls back to defaultValue on parse errors.
//==========================================================================================================
inline uint64_t GetEnvUInt64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(v.c_str(), &end, 10);
    if (end == v.c_str() || (end != nullptr && *end != '\0')) {
        return defaultValue;
    }
    return static_cast<uint64_t>(parsed);
}

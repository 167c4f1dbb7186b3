// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>

namespace roomdl {

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;

// Bumped whenever the client protocol changes incompatibly
inline constexpr int PROTOCOL_VERSION = 1;

[[nodiscard]] inline std::string version_string() {
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "."
         + std::to_string(VERSION_PATCH);
}

} // namespace roomdl

// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string>
#include <vector>

namespace roomdl::organizer {

struct OrganizeResult {
    std::vector<std::string> extracted_files;  // Archive members as unpacked, before any move
    std::vector<std::string> moved_files;      // Final locations
    std::vector<std::string> errors;
};

// Post-download hook. Runs synchronously on the queue worker.
class Organizer {
public:
    virtual ~Organizer() = default;

    [[nodiscard]] virtual OrganizeResult apply(const std::string& ruleset, const std::string& file_path) = 0;
};

} // namespace roomdl::organizer

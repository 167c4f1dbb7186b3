// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace roomdl::catalog {

// One row of a remote directory listing
struct Listing {
    std::string name;
    std::optional<std::string> download_url;
    std::optional<std::string> size;           // As displayed, e.g. "1.2 GiB"
};

// Turns a listing URL into candidate items. Errors are returned to the
// caller as-is and never enter the queue lifecycle.
class Catalog {
public:
    virtual ~Catalog() = default;

    [[nodiscard]] virtual std::expected<std::vector<Listing>, core::TransferError>
    scrape(const std::string& url) = 0;
};

} // namespace roomdl::catalog

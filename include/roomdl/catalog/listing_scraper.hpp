// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/catalog/catalog.hpp>
#include <roomdl/core/config.hpp>
#include <roomdl/core/url.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace roomdl::catalog {

// Decode the handful of entities directory listings actually use
[[nodiscard]] std::string decode_entities(std::string_view text);

// Case-insensitive suffix match, extensions may be given with or without the dot.
// An empty filter accepts everything.
[[nodiscard]] bool matches_extension(std::string_view name, const std::vector<std::string>& extensions) noexcept;

// Parse a static-file directory listing. Table rows whose first cell holds
// an anchor become entries, the second cell is the displayed size. Pages
// without such rows fall back to bare anchors (autoindex <pre> output).
[[nodiscard]] std::vector<Listing> parse_listing(std::string_view html,
                                                 const core::Url& page,
                                                 const std::vector<std::string>& extensions);

class ListingScraper final : public Catalog {
public:
    explicit ListingScraper(core::TransferOptions options = {}, std::vector<std::string> extensions = {});

    [[nodiscard]] std::expected<std::vector<Listing>, core::TransferError>
    scrape(const std::string& url) override;

private:
    core::TransferOptions options_;
    std::vector<std::string> extensions_;
};

} // namespace roomdl::catalog

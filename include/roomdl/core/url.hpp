// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace roomdl::core {

// Parsed absolute URL. Only the parts a listing page or a redirect can
// reference are kept; userinfo survives a round trip through full().
class Url {
public:
    Url() = default;

    static std::expected<Url, std::error_code> parse(std::string_view text) noexcept;

    // href from a listing page or a Location header, taken relative to base
    static std::expected<Url, std::error_code> resolve(const Url& base, std::string_view ref) noexcept;

    std::string_view scheme() const noexcept { return scheme_; }
    std::string_view host() const noexcept { return host_; }
    std::string_view port() const noexcept { return port_; }
    std::string_view path() const noexcept { return path_; }
    std::string_view query() const noexcept { return query_; }
    std::string_view fragment() const noexcept { return fragment_; }

    bool is_http() const noexcept { return scheme_ == "http" || scheme_ == "https"; }
    bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::string full() const;
    // scheme://host[:port]
    [[nodiscard]] std::string base() const;
    // base() plus the path up to and including its last '/'
    [[nodiscard]] std::string directory() const;
    // Decoded last path segment, "index.html" for a directory URL
    [[nodiscard]] std::string filename() const;

private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// "%20" -> " ". Malformed escapes pass through unchanged.
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace roomdl::core

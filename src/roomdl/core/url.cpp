// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace roomdl::core {

namespace {

// RFC 3986 section 5.2.4, simplified to segment stacking
std::string remove_dot_segments(std::string_view path) {
    std::vector<std::string_view> out;
    bool trailing_slash = !path.empty() && path.back() == '/';

    std::size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        auto seg = path.substr(pos, next - pos);

        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailing_slash = true;
        } else if (seg == ".") {
            trailing_slash = true;
        } else if (!seg.empty()) {
            out.push_back(seg);
            trailing_slash = false;
        }
        pos = next + 1;
    }
    if (!path.empty() && path.back() == '/') trailing_slash = true;

    std::string result = "/";
    for (std::size_t i = 0; i < out.size(); ++i) {
        result += out[i];
        if (i + 1 < out.size()) result += '/';
    }
    if (trailing_slash && !out.empty()) result += '/';
    return result;
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    try {
        // Convert scheme to lowercase and store
        std::string lower_scheme;
        lower_scheme.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            const auto c = static_cast<unsigned char>(url_str[i]);
            if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
                return std::unexpected(make_error_code(TransferErrc::invalid_url));
            }
            lower_scheme += static_cast<char>(std::tolower(c));
        }
        url.scheme_ = std::move(lower_scheme);

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) query_start = url_str.length();

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        // host_end is at the first of: /, ?, #, or end
        auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

        std::size_t authority_start = rest_start;

        // Userinfo (user:pass@host:port)
        auto at_pos = url_str.rfind('@', host_end);
        if (at_pos != std::string_view::npos && at_pos >= rest_start && at_pos < host_end) {
            url.userinfo_ = std::string(url_str.substr(rest_start, at_pos - rest_start));
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 address in brackets [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(TransferErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
                url.port_ = std::string(authority.substr(bracket_end + 2));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        for (char c : url.port_) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::unexpected(make_error_code(TransferErrc::invalid_url));
            }
        }

        // Extract path (if present)
        if (path_start == host_end && path_start < url_str.length()) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        // Extract query (if present)
        if (query_start < url_str.length() && query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        // Extract fragment (if present)
        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    // Validate that we got a host
    if (url.host_.empty()) {
        return std::unexpected(make_error_code(TransferErrc::invalid_url));
    }

    return url;
}

std::expected<Url, std::error_code> Url::resolve(const Url& base, std::string_view ref) noexcept {
    // Trim surrounding whitespace, servers occasionally pad Location
    while (!ref.empty() && std::isspace(static_cast<unsigned char>(ref.front()))) ref.remove_prefix(1);
    while (!ref.empty() && std::isspace(static_cast<unsigned char>(ref.back()))) ref.remove_suffix(1);

    if (ref.empty()) {
        return base;
    }

    // Absolute reference
    if (ref.find("://") != std::string_view::npos) {
        auto colon = ref.find(':');
        auto slash = ref.find('/');
        if (colon < slash) {
            return parse(ref);
        }
    }

    try {
        // Scheme-relative ("//host/path")
        if (ref.starts_with("//")) {
            return parse(std::string(base.scheme_) + ":" + std::string(ref));
        }

        Url out = base;
        out.fragment_.clear();

        // Split reference into path / query / fragment
        auto frag_pos = ref.find('#');
        std::string_view fragment;
        if (frag_pos != std::string_view::npos) {
            fragment = ref.substr(frag_pos + 1);
            ref = ref.substr(0, frag_pos);
        }
        auto query_pos = ref.find('?');
        std::string_view query;
        bool has_query = false;
        if (query_pos != std::string_view::npos) {
            query = ref.substr(query_pos + 1);
            ref = ref.substr(0, query_pos);
            has_query = true;
        }

        if (ref.empty()) {
            // Query-only or fragment-only reference keeps base path
            if (has_query) out.query_ = std::string(query);
        } else if (ref.front() == '/') {
            out.path_ = remove_dot_segments(ref);
            out.query_ = std::string(query);
        } else {
            auto dir_end = base.path_.rfind('/');
            std::string merged = dir_end == std::string::npos ? "/" : base.path_.substr(0, dir_end + 1);
            merged += ref;
            out.path_ = remove_dot_segments(merged);
            out.query_ = std::string(query);
        }
        out.fragment_ = std::string(fragment);
        return out;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string Url::full() const {
    std::string result = base();
    if (!path_.empty()) {
        result += path_;
    }
    if (!query_.empty()) {
        result += "?";
        result += query_;
    }
    if (!fragment_.empty()) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::directory() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return base() + "/";
    }
    return base() + path_.substr(0, last_slash + 1);
}

std::string Url::filename() const {
    // Find the last '/' in path and extract filename
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_.empty() ? "index.html" : percent_decode(path_);
    }
    auto filename = path_.substr(last_slash + 1);
    // For directory URLs (path ends with /), default to index.html
    if (filename.empty()) {
        return "index.html";
    }
    return percent_decode(filename);
}

std::string percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

} // namespace roomdl::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/catalog/listing_scraper.hpp>
#include <roomdl/core/http_session.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace roomdl::catalog {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Drop markup, collapse to the visible text
std::string strip_tags(std::string_view html) {
    std::string out;
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>') {
            in_tag = false;
        } else if (!in_tag) {
            out += c;
        }
    }
    return decode_entities(trim(out));
}

// Spans of <tag ...>...</tag> inside html, located on a lower-cased copy
std::vector<std::string_view> elements(std::string_view html, std::string_view lower, std::string_view tag) {
    std::vector<std::string_view> out;
    std::string open = "<" + std::string(tag);
    std::string close = "</" + std::string(tag);

    std::size_t pos = 0;
    while ((pos = lower.find(open, pos)) != std::string_view::npos) {
        auto after = pos + open.size();
        if (after < lower.size() && std::isalpha(static_cast<unsigned char>(lower[after]))) {
            pos = after;  // <th> while looking for <t, <tbody> while looking for <tr ...
            continue;
        }
        auto body_start = lower.find('>', after);
        if (body_start == std::string_view::npos) break;
        ++body_start;

        auto end = lower.find(close, body_start);
        auto next_open = lower.find(open, body_start);
        // Unclosed rows and cells end where the next one starts
        if (end == std::string_view::npos || (next_open != std::string_view::npos && next_open < end)) {
            end = next_open == std::string_view::npos ? lower.size() : next_open;
        }
        out.push_back(html.substr(body_start, end - body_start));
        pos = end;
    }
    return out;
}

struct Anchor {
    std::string href;
    std::string text;
};

std::vector<Anchor> anchors(std::string_view html) {
    static const std::regex pattern(
        R"re(<a\s[^>]*?href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+))[^>]*>([^<]*(?:<(?!/a>)[^<]*)*)</a>)re",
        std::regex::icase | std::regex::ECMAScript);

    std::vector<Anchor> out;
    std::string text(html);
    for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern); it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        std::string href = m[1].matched ? m[1].str() : m[2].matched ? m[2].str() : m[3].str();
        out.push_back({decode_entities(href), strip_tags(m[4].str())});
    }
    return out;
}

bool is_parent_link(const Anchor& anchor) {
    auto lower = to_lower(anchor.text);
    return lower.find("parent directory") != std::string::npos
        || anchor.href == "../" || anchor.href == ".." || anchor.href == "/"
        || anchor.text == ".." || anchor.text == "../";
}

bool is_navigation(const Anchor& anchor) {
    // Sort links ("?C=N;O=D"), fragments and subdirectories
    return anchor.href.empty() || anchor.href.front() == '?' || anchor.href.front() == '#'
        || anchor.href.back() == '/';
}

std::optional<Listing> make_listing(const Anchor& anchor, const core::Url& page) {
    if (is_parent_link(anchor) || is_navigation(anchor)) {
        return std::nullopt;
    }
    Listing listing;
    listing.name = anchor.text;
    auto resolved = core::Url::resolve(page, anchor.href);
    if (resolved) {
        listing.download_url = resolved->full();
        // autoindex shortens long names to "prefix..>"
        if (listing.name.empty() || listing.name.ends_with("..>")) {
            listing.name = resolved->filename();
        }
    }
    if (listing.name.empty()) {
        return std::nullopt;
    }
    return listing;
}

} // namespace

std::string decode_entities(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        auto semi = text.find(';', i);
        if (semi == std::string_view::npos || semi - i > 10) {
            out += text[i];
            continue;
        }
        auto entity = text.substr(i + 1, semi - i - 1);

        if (entity == "amp")                       out += '&';
        else if (entity == "lt")                   out += '<';
        else if (entity == "gt")                   out += '>';
        else if (entity == "quot")                 out += '"';
        else if (entity == "apos")                 out += '\'';
        else if (entity == "nbsp")                 out += ' ';
        else if (entity.size() > 1 && entity[0] == '#') {
            std::uint32_t cp = 0;
            auto digits = entity.substr(1);
            int base = 10;
            if (!digits.empty() && (digits[0] == 'x' || digits[0] == 'X')) {
                digits.remove_prefix(1);
                base = 16;
            }
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                out += text[i];
                continue;
            }
            append_utf8(out, cp);
        } else {
            out += text[i];
            continue;
        }
        i = semi;
    }
    return out;
}

bool matches_extension(std::string_view name, const std::vector<std::string>& extensions) noexcept {
    if (extensions.empty()) {
        return true;
    }
    auto ieq = [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    };
    for (const auto& ext : extensions) {
        std::string_view e(ext);
        if (!e.empty() && e.front() == '.') e.remove_prefix(1);
        if (e.empty() || name.size() <= e.size()) continue;
        auto tail = name.substr(name.size() - e.size());
        if (name[name.size() - e.size() - 1] == '.' && std::equal(tail.begin(), tail.end(), e.begin(), e.end(), ieq)) {
            return true;
        }
    }
    return false;
}

std::vector<Listing> parse_listing(std::string_view html,
                                   const core::Url& page,
                                   const std::vector<std::string>& extensions) {
    std::vector<Listing> out;
    auto lower = to_lower(html);

    for (auto row : elements(html, lower, "tr")) {
        auto row_lower = to_lower(row);
        auto cells = elements(row, row_lower, "td");
        if (cells.empty()) {
            continue;
        }
        auto links = anchors(cells[0]);
        if (links.empty()) {
            continue;
        }
        auto listing = make_listing(links.front(), page);
        if (!listing || !matches_extension(listing->name, extensions)) {
            continue;
        }
        if (cells.size() > 1) {
            auto size = strip_tags(cells[1]);
            if (!size.empty() && size != "-") {
                listing->size = std::move(size);
            }
        }
        out.push_back(std::move(*listing));
    }

    if (!out.empty()) {
        return out;
    }

    for (const auto& anchor : anchors(html)) {
        auto listing = make_listing(anchor, page);
        if (listing && matches_extension(listing->name, extensions)) {
            out.push_back(std::move(*listing));
        }
    }
    return out;
}

//=============================================================================
// ListingScraper
//=============================================================================

ListingScraper::ListingScraper(core::TransferOptions options, std::vector<std::string> extensions)
    : options_(options)
    , extensions_(std::move(extensions)) {}

std::expected<std::vector<Listing>, core::TransferError>
ListingScraper::scrape(const std::string& url) {
    auto page = core::Url::parse(url);
    if (!page || !page->is_http()) {
        return std::unexpected(core::TransferError(make_error_code(core::TransferErrc::invalid_url), url));
    }

    core::HttpSession session(options_);
    auto body = session.fetch_text(url);
    if (!body) {
        spdlog::warn("Scrape of {} failed: {}", url, body.error().message());
        return std::unexpected(body.error());
    }

    try {
        auto listing = parse_listing(*body, *page, extensions_);
        spdlog::info("Scraped {} entries from {}", listing.size(), url);
        return listing;
    } catch (const std::regex_error& e) {
        return std::unexpected(core::TransferError(make_error_code(core::TransferErrc::network_error), e.what()));
    }
}

} // namespace roomdl::catalog

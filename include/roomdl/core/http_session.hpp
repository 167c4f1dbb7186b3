// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/config.hpp>
#include <roomdl/core/error.hpp>
#include <curl/curl.h>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <stop_token>
#include <string>

namespace roomdl::core {

// RAII curl easy handle
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

// Response headers keyed by lower-cased name
using HeaderMap = std::map<std::string, std::string>;

// CURLOPT_HEADERFUNCTION collecting into a HeaderMap passed as userdata
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata);

// Translate a curl result into the transfer error space
[[nodiscard]] TransferErrc transfer_errc_from_curl(CURLcode code) noexcept;

[[nodiscard]] bool is_redirect(long status) noexcept;

struct HttpResponse {
    std::int32_t status_code{0};
    HeaderMap headers;
    std::optional<std::uint64_t> content_length;
    std::string location;
};

class HttpSession {
public:
    explicit HttpSession(TransferOptions options = {});

    // Single-hop HEAD, redirects are returned to the caller.
    // A stop request aborts the request with TransferErrc::cancelled.
    [[nodiscard]] std::expected<HttpResponse, TransferError>
    head(const std::string& url, std::stop_token stop = {}) const noexcept;

    // Best-effort size discovery. Follows redirects by hand and
    // yields nullopt on any failure, timeout, non-200 reply or stop.
    [[nodiscard]] std::optional<std::uint64_t>
    probe_size(const std::string& url, std::stop_token stop = {}) const noexcept;

    // GET a small text document (listing pages) into memory
    [[nodiscard]] std::expected<std::string, TransferError>
    fetch_text(const std::string& url) const noexcept;

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    TransferOptions options_;
};

// Parse a Content-Length header value, nullopt if absent or malformed
[[nodiscard]] std::optional<std::uint64_t> parse_content_length(const HeaderMap& headers) noexcept;

} // namespace roomdl::core

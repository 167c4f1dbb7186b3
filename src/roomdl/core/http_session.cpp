// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/core/http_session.hpp>
#include <roomdl/core/url.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <string_view>

namespace roomdl::core {

namespace {

constexpr std::size_t MAX_TEXT_SIZE = 16 * 1024 * 1024;  // Listing pages larger than this are refused

std::size_t discard_callback(char*, std::size_t size, std::size_t nitems, void*) {
    return size * nitems;
}

std::size_t text_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    std::size_t total = size * nitems;
    if (out->size() + total > MAX_TEXT_SIZE) {
        return 0;
    }
    out->append(ptr, total);
    return total;
}

// Polled by curl at least once a second, also while waiting on a silent peer
int stop_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    const auto* stop = static_cast<const std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

} // namespace

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<HeaderMap*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block (1xx interim replies)
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

TransferErrc transfer_errc_from_curl(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:                    return TransferErrc::success;
        case CURLE_OPERATION_TIMEDOUT:    return TransferErrc::timeout;
        case CURLE_PARTIAL_FILE:          return TransferErrc::truncated;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY: return TransferErrc::dns_error;
        case CURLE_COULDNT_CONNECT:       return TransferErrc::refused;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:    return TransferErrc::ssl_error;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:  return TransferErrc::invalid_url;
        case CURLE_TOO_MANY_REDIRECTS:    return TransferErrc::too_many_redirects;
        case CURLE_ABORTED_BY_CALLBACK:   return TransferErrc::cancelled;
        case CURLE_WRITE_ERROR:           return TransferErrc::io_error;
        default:                          return TransferErrc::network_error;
    }
}

bool is_redirect(long status) noexcept {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::optional<std::uint64_t> parse_content_length(const HeaderMap& headers) noexcept {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(TransferOptions options)
    : options_(options) {}

std::expected<HttpResponse, TransferError>
HttpSession::head(const std::string& url, std::stop_token stop) const noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(TransferError(make_error_code(TransferErrc::cancelled)));
    }


    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(TransferError(make_error_code(TransferErrc::network_error), "curl_easy_init failed"));
    }

    HttpResponse response{};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(HEAD_TIMEOUT_SEC));
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, discard_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, stop_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(TransferError(make_error_code(transfer_errc_from_curl(result)),
                                             curl_easy_strerror(result)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is unreliable for HEAD, read the header
    response.content_length = parse_content_length(response.headers);

    auto loc = response.headers.find("location");
    if (loc != response.headers.end()) {
        response.location = loc->second;
    }
    return response;
}

std::optional<std::uint64_t>
HttpSession::probe_size(const std::string& url, std::stop_token stop) const noexcept {
    auto current = Url::parse(url);
    if (!current) {
        return std::nullopt;
    }

    for (std::uint32_t hop = 0; hop <= MAX_REDIRECTS; ++hop) {
        if (stop.stop_requested()) {
            return std::nullopt;
        }

        std::string target;
        try {
            target = current->full();
        } catch (const std::bad_alloc&) {
            return std::nullopt;
        }

        auto response = head(target, stop);
        if (!response) {
            if (response.error().is(TransferErrc::cancelled)) {
                spdlog::debug("HEAD {} cancelled", target);
                return std::nullopt;
            }
            spdlog::warn("HEAD {} failed, size unknown: {}", target, response.error().message());
            return std::nullopt;
        }

        if (is_redirect(response->status_code) && !response->location.empty()) {
            auto next = Url::resolve(*current, response->location);
            if (!next) {
                return std::nullopt;
            }
            spdlog::debug("HEAD {} -> {} {}", target, response->status_code, response->location);
            current = std::move(next);
            continue;
        }

        if (response->status_code != 200) {
            spdlog::warn("HEAD {} returned {}, size unknown", target, response->status_code);
            return std::nullopt;
        }
        return response->content_length;
    }

    spdlog::warn("HEAD {} exceeded {} redirects, size unknown", url, MAX_REDIRECTS);
    return std::nullopt;
}

std::expected<std::string, TransferError>
HttpSession::fetch_text(const std::string& url) const noexcept {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(TransferError(make_error_code(TransferErrc::network_error), "curl_easy_init failed"));
    }

    std::string body;

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.inactivity_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl.ptr, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, text_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        return std::unexpected(TransferError(make_error_code(transfer_errc_from_curl(result)),
                                             curl_easy_strerror(result)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        TransferError error(make_error_code(TransferErrc::http_status));
        error.http_status = static_cast<std::int32_t>(http_code);
        return std::unexpected(std::move(error));
    }
    return body;
}

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_ALL);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace roomdl::core

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/core/transfer.hpp>
#include <roomdl/core/http_session.hpp>
#include <roomdl/core/url.hpp>
#include <roomdl/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>

namespace roomdl::core {

namespace {

// State shared with the curl callbacks for one transfer
struct TransferSession {
    CurlHandle curl;
    disk::FileWriter writer;
    ProgressMeter meter;
    HeaderMap headers;
    std::stop_token stop;
    const ProgressFn* on_progress{nullptr};
    std::string destination;
    std::uint64_t downloaded{0};
    bool cancelled{false};
    std::error_code disk_error;

    TransferSession(std::stop_token token, const ProgressFn& fn, std::string dest,
                    std::chrono::milliseconds interval)
        : meter(interval, ProgressMeter::Clock::now())
        , stop(std::move(token))
        , on_progress(&fn)
        , destination(std::move(dest)) {}

    void emit(const ProgressSample& sample) {
        if (*on_progress) {
            (*on_progress)(sample);
        }
    }
};

bool is_success(long status) noexcept {
    return status >= 200 && status < 300;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* session = static_cast<TransferSession*>(userdata);
    std::size_t bytes = size * nmemb;

    if (session->stop.stop_requested()) {
        session->cancelled = true;
        return 0;
    }

    long status = 0;
    curl_easy_getinfo(session->curl.ptr, CURLINFO_RESPONSE_CODE, &status);
    if (!is_success(status)) {
        // Redirect and error bodies are not part of the download
        return bytes;
    }

    if (!session->writer.is_open()) {
        if (auto ec = session->writer.open(session->destination, PART_SUFFIX); ec) {
            session->disk_error = ec;
            return 0;
        }
        if (!session->meter.total()) {
            session->meter.set_total(parse_content_length(session->headers));
        }
    }

    if (auto ec = session->writer.write(ptr, bytes); ec) {
        session->disk_error = ec;
        return 0;
    }
    session->downloaded += bytes;

    try {
        if (auto sample = session->meter.update(session->downloaded, ProgressMeter::Clock::now())) {
            session->emit(*sample);
        }
    } catch (const std::exception& e) {
        spdlog::warn("Progress observer threw: {}", e.what());
    }
    return bytes;
}

// Checks for cancellation between chunks, returning non-zero aborts the request
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* session = static_cast<TransferSession*>(userdata);
    if (session->stop.stop_requested()) {
        session->cancelled = true;
        return 1;
    }
    return 0;
}

TransferError make_error(TransferErrc errc, std::string detail = {}) {
    return TransferError(make_error_code(errc), std::move(detail));
}

} // namespace

//=============================================================================
// HttpTransfer
//=============================================================================

HttpTransfer::HttpTransfer(TransferOptions options)
    : options_(options) {}

std::expected<std::uint64_t, TransferError>
HttpTransfer::run(const std::string& source_url,
                  const std::string& destination,
                  const ProgressFn& on_progress,
                  std::stop_token stop) {
    if (source_url.empty()) {
        return std::unexpected(make_error(TransferErrc::missing_source));
    }

    auto current = Url::parse(source_url);
    if (!current || !current->is_http()) {
        return std::unexpected(make_error(TransferErrc::invalid_url, source_url));
    }

    if (stop.stop_requested()) {
        return std::unexpected(make_error(TransferErrc::cancelled));
    }

    TransferSession session(stop, on_progress, destination, options_.progress_interval);

    if (options_.head_prefetch) {
        HttpSession http(options_);
        session.meter.set_total(http.probe_size(current->full(), stop));
    }

    session.curl = CurlHandle(curl_easy_init());
    if (!session.curl.ptr) {
        return std::unexpected(make_error(TransferErrc::network_error, "curl_easy_init failed"));
    }
    CURL* curl = session.curl.ptr;

    struct curl_slist* request_headers = nullptr;
    request_headers = curl_slist_append(request_headers, "Accept-Encoding: identity");
    request_headers = curl_slist_append(request_headers, "Connection: close");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(request_headers, &curl_slist_free_all);

    char errbuf[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request_headers);
    curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &session);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &session);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &session.headers);

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.inactivity_timeout.count()));

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

    for (std::uint32_t redirects = 0;; ) {
        if (stop.stop_requested()) {
            return std::unexpected(make_error(TransferErrc::cancelled));
        }

        std::string target = current->full();
        curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
        session.headers.clear();
        errbuf[0] = '\0';

        CURLcode result = curl_easy_perform(curl);

        if (session.cancelled || (result == CURLE_ABORTED_BY_CALLBACK && stop.stop_requested())) {
            session.writer.discard();
            return std::unexpected(make_error(TransferErrc::cancelled));
        }
        if (session.disk_error) {
            session.writer.discard();
            TransferError error = make_error(TransferErrc::io_error);
            error.cause = session.disk_error;
            return std::unexpected(std::move(error));
        }
        if (result != CURLE_OK) {
            session.writer.discard();
            return std::unexpected(make_error(transfer_errc_from_curl(result),
                                              errbuf[0] ? std::string(errbuf) : curl_easy_strerror(result)));
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        spdlog::debug("GET {} -> {}", target, status);

        if (is_redirect(status)) {
            auto location = session.headers.find("location");
            if (location == session.headers.end() || location->second.empty()) {
                TransferError error = make_error(TransferErrc::http_status, "redirect without Location");
                error.http_status = static_cast<std::int32_t>(status);
                return std::unexpected(std::move(error));
            }
            if (++redirects > MAX_REDIRECTS) {
                return std::unexpected(make_error(TransferErrc::too_many_redirects, target));
            }
            auto next = Url::resolve(*current, location->second);
            if (!next) {
                return std::unexpected(make_error(TransferErrc::invalid_url, location->second));
            }
            current = std::move(next);
            continue;
        }

        if (!is_success(status)) {
            session.writer.discard();
            TransferError error = make_error(TransferErrc::http_status);
            error.http_status = static_cast<std::int32_t>(status);
            return std::unexpected(std::move(error));
        }

        // Empty bodies never reach the write callback
        if (!session.writer.is_open()) {
            if (auto ec = session.writer.open(destination, PART_SUFFIX); ec) {
                TransferError error = make_error(TransferErrc::io_error);
                error.cause = ec;
                return std::unexpected(std::move(error));
            }
        }

        std::uint64_t written = session.writer.written();
        if (auto ec = session.writer.commit(); ec) {
            TransferError error = make_error(TransferErrc::io_error);
            error.cause = ec;
            return std::unexpected(std::move(error));
        }

        session.emit(session.meter.finish(written, ProgressMeter::Clock::now()));
        return written;
    }
}

} // namespace roomdl::core

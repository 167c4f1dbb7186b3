// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace roomdl::core {

enum class TransferErrc {
    success = 0,
    network_error,
    timeout,
    http_status,
    too_many_redirects,
    missing_source,
    cancelled,
    io_error,
    truncated,
    invalid_url,
    dns_error,
    refused,
    ssl_error,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "roomdl::transfer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:             return "Success";
            case TransferErrc::network_error:       return "Network error";
            case TransferErrc::timeout:             return "Operation timed out";
            case TransferErrc::http_status:         return "Unexpected HTTP status";
            case TransferErrc::too_many_redirects:  return "Too many redirects";
            case TransferErrc::missing_source:      return "Source URL is missing";
            case TransferErrc::cancelled:           return "Cancelled by user";
            case TransferErrc::io_error:            return "Local I/O error";
            case TransferErrc::truncated:           return "Body shorter than Content-Length";
            case TransferErrc::invalid_url:         return "Invalid URL";
            case TransferErrc::dns_error:           return "DNS resolution failed";
            case TransferErrc::refused:             return "Connection refused";
            case TransferErrc::ssl_error:           return "SSL/TLS error";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// Failure of one Transfer, tagged with its underlying cause
struct TransferError {
    std::error_code code;
    std::int32_t http_status{0};  // Set for TransferErrc::http_status
    std::error_code cause;        // Underlying disk/curl-level cause, if any
    std::string detail;           // Raw message kept for diagnostics

    TransferError() = default;
    TransferError(std::error_code c, std::string d = {})
        : code(c), detail(std::move(d)) {}

    [[nodiscard]] bool is(TransferErrc e) const noexcept { return code == make_error_code(e); }

    // Human-readable, e.g. "HTTP 404: Not Found" or "Local I/O error: Disk full"
    [[nodiscard]] std::string message() const;
};

inline std::string TransferError::message() const {
    std::string text;
    if (is(TransferErrc::http_status)) {
        text = "HTTP " + std::to_string(http_status);
    } else {
        text = code.message();
    }
    if (cause) {
        text += ": ";
        text += cause.message();
    }
    if (!detail.empty()) {
        text += " (";
        text += detail;
        text += ")";
    }
    return text;
}

} // namespace roomdl::core

namespace std {

template<>
struct is_error_code_enum<roomdl::core::TransferErrc> : true_type {};

} // namespace std

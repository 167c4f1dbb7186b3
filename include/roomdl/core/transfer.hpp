// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/config.hpp>
#include <roomdl/core/error.hpp>
#include <roomdl/core/progress.hpp>
#include <cstdint>
#include <expected>
#include <stop_token>
#include <string>

namespace roomdl::core {

// One cancellable GET of a remote resource into a local file.
// Implementations leave no partial file behind on failure.
class Transfer {
public:
    virtual ~Transfer() = default;

    // Returns the number of bytes written to destination
    [[nodiscard]] virtual std::expected<std::uint64_t, TransferError>
    run(const std::string& source_url,
        const std::string& destination,
        const ProgressFn& on_progress,
        std::stop_token stop) = 0;
};

// libcurl-backed Transfer. Redirects are followed hop by hop so each
// Location is resolved against the URL that produced it.
class HttpTransfer final : public Transfer {
public:
    explicit HttpTransfer(TransferOptions options = {});

    [[nodiscard]] std::expected<std::uint64_t, TransferError>
    run(const std::string& source_url,
        const std::string& destination,
        const ProgressFn& on_progress,
        std::stop_token stop) override;

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

private:
    TransferOptions options_;
};

} // namespace roomdl::core

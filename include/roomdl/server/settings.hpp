// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/core/config.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace roomdl::server {

struct Settings {
    std::string address{"127.0.0.1"};
    std::uint16_t port{7070};
    std::size_t threads{2};
    std::filesystem::path download_dir{"./downloads"};
    std::filesystem::path state_file{"./state/room.json"};
    std::filesystem::path rulesets_file{"./config/rulesets.json"};
    std::string ruleset;                                        // Empty disables organizing
    std::chrono::seconds idle_timeout{1800};
    std::chrono::seconds idle_sweep_interval{60};
    std::chrono::seconds save_interval{30};
    std::chrono::seconds connect_timeout{core::CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds inactivity_timeout{core::INACTIVITY_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{core::PROGRESS_INTERVAL};
    bool head_prefetch{true};
    std::vector<std::string> extensions;                        // Listing filter, empty keeps all
    std::optional<std::filesystem::path> log_file;
    std::string log_level{"info"};

    [[nodiscard]] core::TransferOptions transfer_options() const noexcept;
};

// Overlay a JSON settings file onto s. Unknown keys are ignored.
[[nodiscard]] std::expected<void, std::string> load_settings_file(const std::filesystem::path& path, Settings& s);

// "--config <file>" is applied first, every other flag overrides it
[[nodiscard]] std::expected<Settings, std::string> parse_serve_arguments(std::span<const std::string> args);

[[nodiscard]] std::string serve_usage();

} // namespace roomdl::server

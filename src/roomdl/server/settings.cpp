// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/server/settings.hpp>
#include <nlohmann/json.hpp>
#include <charconv>
#include <fstream>
#include <limits>

namespace roomdl::server {

namespace {

template<typename T>
std::expected<T, std::string> parse_number(const std::string& flag, const std::string& text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected("Invalid value for " + flag + ": " + text);
    }
    return value;
}

template<typename Duration>
void read_duration(const nlohmann::json& j, const char* key, Duration& out) {
    if (j.contains(key)) {
        out = Duration(j.at(key).get<std::int64_t>());
    }
}

} // namespace

core::TransferOptions Settings::transfer_options() const noexcept {
    core::TransferOptions options;
    options.head_prefetch = head_prefetch;
    options.connect_timeout = connect_timeout;
    options.inactivity_timeout = inactivity_timeout;
    options.progress_interval = progress_interval;
    return options;
}

std::expected<void, std::string> load_settings_file(const std::filesystem::path& path, Settings& s) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected("Cannot open config file " + path.string());
    }

    try {
        auto j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            return std::unexpected("Config file " + path.string() + " must hold a JSON object");
        }

        s.address = j.value("address", s.address);
        s.port = j.value("port", s.port);
        s.threads = j.value("threads", s.threads);
        if (j.contains("downloadDir")) s.download_dir = j.at("downloadDir").get<std::string>();
        if (j.contains("stateFile")) s.state_file = j.at("stateFile").get<std::string>();
        if (j.contains("rulesetsFile")) s.rulesets_file = j.at("rulesetsFile").get<std::string>();
        s.ruleset = j.value("ruleset", s.ruleset);
        read_duration(j, "idleTimeoutSec", s.idle_timeout);
        read_duration(j, "idleSweepIntervalSec", s.idle_sweep_interval);
        read_duration(j, "saveIntervalSec", s.save_interval);
        read_duration(j, "connectTimeoutSec", s.connect_timeout);
        read_duration(j, "inactivityTimeoutSec", s.inactivity_timeout);
        read_duration(j, "progressIntervalMs", s.progress_interval);
        s.head_prefetch = j.value("headPrefetch", s.head_prefetch);
        s.extensions = j.value("extensions", s.extensions);
        if (j.contains("logFile") && j.at("logFile").is_string()) {
            s.log_file = std::filesystem::path(j.at("logFile").get<std::string>());
        }
        s.log_level = j.value("logLevel", s.log_level);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected("Invalid config file " + path.string() + ": " + e.what());
    }
    return {};
}

std::expected<Settings, std::string> parse_serve_arguments(std::span<const std::string> args) {
    Settings settings;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                return std::unexpected("Missing value for --config");
            }
            if (auto loaded = load_settings_file(args[i + 1], settings); !loaded) {
                return std::unexpected(loaded.error());
            }
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (i + 1 >= args.size()) {
            return std::unexpected(arg.starts_with("--") ? "Missing value for " + arg : "Unknown argument: " + arg);
        }
        const auto& value = args[++i];

        if (arg == "--config") {
            continue;
        } else if (arg == "--address") {
            settings.address = value;
        } else if (arg == "--port") {
            auto port = parse_number<std::uint16_t>(arg, value);
            if (!port) return std::unexpected(port.error());
            settings.port = *port;
        } else if (arg == "--threads") {
            auto threads = parse_number<std::size_t>(arg, value);
            if (!threads) return std::unexpected(threads.error());
            settings.threads = *threads;
        } else if (arg == "--download-dir") {
            settings.download_dir = value;
        } else if (arg == "--state") {
            settings.state_file = value;
        } else if (arg == "--rulesets") {
            settings.rulesets_file = value;
        } else if (arg == "--ruleset") {
            settings.ruleset = value;
        } else if (arg == "--log") {
            settings.log_file = std::filesystem::path(value);
        } else {
            return std::unexpected("Unknown argument: " + arg);
        }
    }

    if (settings.threads == 0) {
        settings.threads = 1;
    }
    return settings;
}

std::string serve_usage() {
    return "Usage: roomdl serve [--config <file>] [--address <addr>] [--port <port>] [--threads <n>]\n"
           "                    [--download-dir <dir>] [--state <file>] [--rulesets <file>]\n"
           "                    [--ruleset <name>] [--log <file>]\n";
}

} // namespace roomdl::server

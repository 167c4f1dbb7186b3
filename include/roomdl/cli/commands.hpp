// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace roomdl::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

enum class Command {
    none,
    serve,
    get,
    list,
    help,
    version,
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::string url;
    std::string output_file;
    std::vector<std::string> extensions;
    std::vector<std::string> serve_args;    // Passed through to the settings parser
    bool verbose{false};
    bool quiet{false};
    std::string error;                      // Set when the command line is unusable
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Console sink plus an optional file sink, installed as the default logger
void setup_logging(std::string_view name,
                   const std::optional<std::filesystem::path>& log_file,
                   std::string_view level);

// One-shot transfer with a terminal progress bar
[[nodiscard]] CliResult get(const std::string& url, const std::string& output, bool quiet);

// Print a scraped listing
[[nodiscard]] CliResult list(const std::string& url, const std::vector<std::string>& extensions);

// Run the daemon until interrupted
[[nodiscard]] CliResult serve(const std::vector<std::string>& args, bool verbose);

void print_help(std::string_view program_name);

void print_version();

} // namespace roomdl::cli

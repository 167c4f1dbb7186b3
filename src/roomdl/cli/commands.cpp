// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/cli/commands.hpp>
#include <roomdl/cli/progress_bar.hpp>
#include <roomdl/catalog/listing_scraper.hpp>
#include <roomdl/core/http_session.hpp>
#include <roomdl/core/transfer.hpp>
#include <roomdl/core/units.hpp>
#include <roomdl/core/url.hpp>
#include <roomdl/server/server.hpp>
#include <roomdl/server/settings.hpp>
#include <roomdl/version.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <span>

namespace roomdl::cli {

namespace {

// Keeps curl's global state alive for the duration of a command
struct CurlGlobal {
    CurlGlobal() { core::HttpSession::global_init(); }
    ~CurlGlobal() { core::HttpSession::global_cleanup(); }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    if (argc < 2) {
        args.error = "No command given";
        return args;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        args.command = Command::help;
        return args;
    }
    if (command == "-v" || command == "--version") {
        args.command = Command::version;
        return args;
    }

    if (command == "serve") {
        args.command = Command::serve;
    } else if (command == "get") {
        args.command = Command::get;
    } else if (command == "list") {
        args.command = Command::list;
    } else {
        args.error = "Unknown command: " + command;
        return args;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.command = Command::help;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (args.command == Command::serve) {
            args.serve_args.push_back(std::move(arg));
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                args.error = "Missing value for " + arg;
                return args;
            }
            args.output_file = argv[++i];
        } else if (arg == "-e" || arg == "--ext") {
            if (i + 1 >= argc) {
                args.error = "Missing value for " + arg;
                return args;
            }
            args.extensions.emplace_back(argv[++i]);
        } else if (arg.starts_with("-")) {
            args.error = "Unknown option: " + arg;
            return args;
        } else if (args.url.empty()) {
            args.url = std::move(arg);
        } else {
            args.error = "Unexpected argument: " + arg;
            return args;
        }
    }

    if ((args.command == Command::get || args.command == Command::list) && args.url.empty()) {
        args.error = "No URL specified";
    }
    return args;
}

void setup_logging(std::string_view name,
                   const std::optional<std::filesystem::path>& log_file,
                   std::string_view level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
    }
    auto logger = std::make_shared<spdlog::logger>(std::string(name), sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(std::string(level)));
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
    spdlog::set_default_logger(logger);
}

//=============================================================================
// Commands
//=============================================================================

CliResult get(const std::string& url, const std::string& output, bool quiet) {
    auto parsed = core::Url::parse(url);
    if (!parsed) {
        std::cerr << "Error: Invalid URL: " << url << std::endl;
        return std::unexpected(parsed.error());
    }

    std::string destination = output.empty() ? parsed->filename() : output;

    CurlGlobal curl;
    core::HttpTransfer transfer;
    ProgressBar bar(destination);
    std::stop_source never;

    auto result = transfer.run(parsed->full(), destination,
        [&](const core::ProgressSample& sample) {
            if (!quiet) bar.update(sample);
        },
        never.get_token());

    if (!result) {
        if (!quiet) bar.clear();
        std::cerr << "Error: " << result.error().message() << std::endl;
        return std::unexpected(result.error().code);
    }

    if (!quiet) bar.finish();
    std::cout << "Saved " << destination << " (" << core::format_bytes(*result) << ")" << std::endl;
    return 0;
}

CliResult list(const std::string& url, const std::vector<std::string>& extensions) {
    CurlGlobal curl;
    catalog::ListingScraper scraper({}, extensions);

    auto listing = scraper.scrape(url);
    if (!listing) {
        std::cerr << "Error: " << listing.error().message() << std::endl;
        return std::unexpected(listing.error().code);
    }

    for (const auto& entry : *listing) {
        std::cout << entry.name;
        if (entry.size) {
            std::cout << "\t" << *entry.size;
        }
        if (entry.download_url) {
            std::cout << "\t" << *entry.download_url;
        }
        std::cout << "\n";
    }
    std::cout << listing->size() << " entries" << std::endl;
    return 0;
}

CliResult serve(const std::vector<std::string>& args, bool verbose) {
    auto settings = server::parse_serve_arguments(std::span<const std::string>(args));
    if (!settings) {
        std::cerr << "Error: " << settings.error() << "\n" << server::serve_usage();
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    setup_logging("roomdl", settings->log_file, verbose ? "debug" : settings->log_level);
    spdlog::info("Starting roomdl {} on {}:{}", roomdl::version_string(), settings->address, settings->port);

    CurlGlobal curl;
    try {
        server::Server daemon(std::move(*settings));
        daemon.run();
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "roomdl " << roomdl::version_string() << " - shared download queue\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " serve [OPTIONS]        Run the daemon\n";
    std::cout << "  " << program_name << " get <URL> [-o FILE]    Download one file\n";
    std::cout << "  " << program_name << " list <URL> [-e EXT]    Print a directory listing\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             No progress bar (get)\n";
    std::cout << "  -o, --output <FILE>     Save to specified file (get)\n";
    std::cout << "  -e, --ext <EXT>         Only list files with this extension, repeatable (list)\n";
    std::cout << "\n";
    std::cout << server::serve_usage();
}

void print_version() {
    std::cout << "roomdl " << roomdl::version_string() << " (protocol " << roomdl::PROTOCOL_VERSION << ")" << std::endl;
    std::cout << "Built with C++23, libcurl, Boost.Asio, nlohmann_json, spdlog\n";
}

} // namespace roomdl::cli

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/cli/commands.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace roomdl::cli;

// Report exceptions escaping noexcept code before aborting
static void roomdl_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(roomdl_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    CliResult result = 0;
    switch (args.command) {
    case Command::help:
        print_help(argv[0]);
        return 0;
    case Command::version:
        print_version();
        return 0;
    case Command::get:
        setup_logging("roomdl", std::nullopt, args.verbose ? "debug" : "warn");
        result = get(args.url, args.output_file, args.quiet);
        break;
    case Command::list:
        setup_logging("roomdl", std::nullopt, args.verbose ? "debug" : "warn");
        result = list(args.url, args.extensions);
        break;
    case Command::serve:
        result = serve(args.serve_args, args.verbose);
        break;
    case Command::none:
        print_help(argv[0]);
        return 1;
    }

    if (!result) {
        return 1;
    }
    return *result;
}

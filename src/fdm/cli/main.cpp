// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/cli/commands.hpp>
#include <fdm/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace fdm::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void fdm_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(fdm_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.command == Command::help) {
        print_help(argv[0]);
        return exit_ok;
    }
    if (args.command == Command::version) {
        print_version();
        return exit_ok;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return exit_usage;
    }

    setup_logging(args.verbose, false);

    auto config = fdm::core::DownloadConfig::load(args.config_path);
    if (!config) {
        std::cerr << "Error: cannot use configuration " << args.config_path
                  << ": " << config.error().message() << std::endl;
        return exit_config;
    }

    switch (args.command) {
        case Command::download:
            return download(args, *config);
        case Command::config:
            return configure(args, *config, std::cout);
        default:
            return exit_usage;
    }
}

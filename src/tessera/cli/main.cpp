// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/cli/commands.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace tessera::cli;

// Report exceptions escaping noexcept functions before aborting
static void tessera_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(tessera_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    auto result = args.info_only ? info(args) : download(args);
    return result ? *result : 1;
}

/**
 * @file main.cpp
 * @brief linepipe - Entry point
 */

#include <linepipe/cli/cli.hpp>
#include <linepipe/common/debug.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);

    auto options = linepipe::cli::parse_args(argc, argv);
    if (!options) {
        std::cerr << "linepipe: " << options.error().full_message() << '\n'
                  << "Try '" << (argc > 0 ? argv[0] : "linepipe") << " --help'.\n";
        return linepipe::cli::EXIT_USAGE_ERROR;
    }

    int rc = linepipe::cli::run(options.value(), std::cin, std::cout, std::cerr);

    std::cout.flush();
    linepipe::common::debug::shutdown_logging();
    return rc;
}

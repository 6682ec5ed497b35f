/**
 * @file main.cpp
 * @brief Entry point for disk-sanitizer-cli
 */

#include "cli/CliApplication.hpp"
#include "util/Logger.hpp"

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        cli::CliApplication app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        LOG_ERROR("main", std::string("Unhandled exception: ") + e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }
}

#include <iostream>
#include <string>

#include "Driver.h"
#include "Logger.h"

// --- Standard Color Constants ---
const char* const RESET = "\033[0m";
const char* const BOLD = "\033[1m";
const char* const RED = "\033[31m";
const char* const GREEN = "\033[32m";
const char* const CYAN = "\033[36m";

int main(int argc, char* argv[]) {
    // 1. Handle command-line arguments.
    spi::DriverOptions options;
    std::string error;
    if (!spi::parseArguments(argc, argv, options, error)) {
        std::cerr << RED << BOLD << "Error: " << RESET << error << std::endl;
        std::cerr << spi::usage() << std::endl;
        return 1;
    }

    // 2. Check for the version flag.
    if (options.show_version) {
        std::cout << GREEN << BOLD << "spi: Simple Pascal Interpreter" << RESET << std::endl;
        std::cout << CYAN << "  -> version: " << RESET << BOLD << spi::SPI_VERSION << RESET << std::endl;
        return 0;
    }

    // 3. Run the program.
    spi::Driver driver(options);
    bool success = driver.runFile();

    if (options.verbose) {
        spi::Logger::instance().dump(std::cerr);
    }

    // 4. Return the appropriate final exit code.
    return success ? 0 : 1;
}

#pragma once

#include <iostream>
#include <optional>
#include <string>

#include "Errors.h"
#include "SymbolTable.h"
#include "Value.h"

namespace spi {

    const std::string SPI_VERSION = "1.0.0";

    // Command-line configuration of one spi invocation.
    struct DriverOptions {
        std::string source_path;
        bool show_version = false;
        bool dump_tokens = false;   // --tokens
        bool dump_ast = false;      // --ast
        bool json_output = false;   // --json
        bool verbose = false;       // --verbose: dump the log buffer at exit
        bool use_color = true;      // --no-color
    };

    // Parses argv into options. On failure returns false and sets `error`.
    bool parseArguments(int argc, const char* const argv[], DriverOptions& options, std::string& error);

    std::string usage();

    // Everything one run produces. Either `error` is set, or the program ran
    // to completion and `symbols`/`globals` hold the final state.
    struct RunResult {
        bool success = false;
        std::string program_name;
        std::optional<SymbolTable> symbols;
        GlobalScope globals;
        std::optional<SpiError> error;
    };

    /**
     * @class Driver
     * @brief Loads source text and runs it through the lexer, parser, symbol
     *        table builder and interpreter, then prints the final state.
     */
    class Driver {
    public:
        explicit Driver(DriverOptions options, std::ostream& out = std::cout, std::ostream& err = std::cerr);

        // Reads the file named by the options and executes it.
        bool runFile();

        // Runs the pipeline and prints the result (or the error).
        bool execute(const std::string& source);

        // Runs the pipeline without printing the final state. Token and AST
        // dumps requested in the options are still written.
        RunResult run(const std::string& source);

    private:
        std::optional<std::string> read_file(const std::string& path);
        void printResult(const RunResult& result);
        void printError(const std::string& source, const SpiError& error);

        const DriverOptions m_options;
        std::ostream& m_out;
        std::ostream& m_err;
    };

} // namespace spi

#include "Driver.h"
#include "ASTPrinter.h"
#include "CollectingErrorHandler.h"
#include "ErrorHandler.h"
#include "Interpreter.h"
#include "JsonExport.h"
#include "Lexer.h"
#include "Logger.h"
#include "Parser.h"
#include "SymbolTableBuilder.h"

#include <fstream>
#include <sstream>

namespace spi {

    bool parseArguments(int argc, const char* const argv[], DriverOptions& options, std::string& error) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-v" || arg == "--version") {
                options.show_version = true;
            } else if (arg == "--tokens") {
                options.dump_tokens = true;
            } else if (arg == "--ast") {
                options.dump_ast = true;
            } else if (arg == "--json") {
                options.json_output = true;
            } else if (arg == "--verbose") {
                options.verbose = true;
            } else if (arg == "--no-color") {
                options.use_color = false;
            } else if (!arg.empty() && arg[0] == '-') {
                error = "Unknown option '" + arg + "'.";
                return false;
            } else if (options.source_path.empty()) {
                options.source_path = arg;
            } else {
                error = "Only one source file may be given.";
                return false;
            }
        }

        if (!options.show_version && options.source_path.empty()) {
            error = "No source file given.";
            return false;
        }
        return true;
    }

    std::string usage() {
        return "Usage: spi <source.pas> [--tokens] [--ast] [--json] [--verbose] [--no-color]\n"
               "       spi -v | --version";
    }

    Driver::Driver(DriverOptions options, std::ostream& out, std::ostream& err)
            : m_options(std::move(options)), m_out(out), m_err(err) {}

    std::optional<std::string> Driver::read_file(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool Driver::runFile() {
        auto source = read_file(m_options.source_path);
        if (!source) {
            m_err << "Error: could not open file '" << m_options.source_path << "'." << std::endl;
            return false;
        }
        SPI_LOG("driver: loaded '" + m_options.source_path + "' (" + std::to_string(source->size()) + " bytes)");
        return execute(*source);
    }

    RunResult Driver::run(const std::string& source) {
        RunResult result;
        try {
            if (m_options.dump_tokens) {
                for (const auto& token : Lexer(source).scanTokens()) {
                    m_out << token.toString() << "\n";
                }
            }

            // 1. Lex and parse.
            Lexer lexer(source);
            Parser parser(lexer);
            auto program = parser.parse();
            result.program_name = program->program_name;

            if (m_options.dump_ast) {
                ASTPrinter printer;
                m_out << printer.print(*program);
            }

            // 2. Declaration/usage check.
            SymbolTableBuilder builder;
            builder.build(*program);

            // 3. Evaluate.
            Interpreter interpreter;
            const GlobalScope& globals = interpreter.interpret(*program);

            result.symbols = builder.getSymbolTable();
            result.globals = globals;
            result.success = true;
        } catch (const SpiError& error) {
            SPI_LOG("driver: run aborted with " + to_string(error.kind()) + ": " + error.what());
            result.error = error;
        }
        return result;
    }

    bool Driver::execute(const std::string& source) {
        RunResult result = run(source);
        if (!result.success) {
            printError(source, *result.error);
            return false;
        }
        printResult(result);
        return true;
    }

    void Driver::printResult(const RunResult& result) {
        if (m_options.json_output) {
            json document = {
                {"program", result.program_name},
                {"symbols", symbol_table_to_json(*result.symbols)},
                {"globals", global_scope_to_json(result.globals)}
            };
            m_out << document.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            return;
        }

        m_out << result.symbols->toString() << "\n";
        m_out << "Runtime GLOBAL_SCOPE contents" << "\n";
        for (const auto& [name, value] : result.globals) {
            m_out << name << " = " << toString(value) << "\n";
        }
    }

    void Driver::printError(const std::string& source, const SpiError& error) {
        if (m_options.json_output) {
            CollectingErrorHandler handler(source);
            handler.report(error);
            json diagnostics = json::array();
            for (const auto& d : handler.get_diagnostics()) diagnostics.push_back(diagnostic_to_json(d));
            m_out << json{{"diagnostics", diagnostics}}.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            return;
        }

        ErrorHandler handler(source, m_err, m_options.use_color);
        handler.report(error);
    }

} // namespace spi

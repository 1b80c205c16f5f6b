#include "ErrorHandler.h"
#include <sstream>

namespace {
    const char* const CYAN = "\033[36m";
    const char* const RED = "\033[31m";
    const char* const RESET = "\033[0m";
    const char* const BOLD = "\033[1m";
}

namespace spi {

    ErrorHandler::ErrorHandler(const std::string &source, std::ostream &out, bool use_color)
            : m_out(out), m_use_color(use_color) {
        std::stringstream ss(source);
        std::string line;
        while (std::getline(ss, line, '\n')) {
            m_lines.push_back(line);
        }
    }

    void ErrorHandler::report(const Token &token, const std::string &message) {
        m_hadError = true;

        // Standard error header
        if (m_use_color) m_out << BOLD << RED;
        m_out << "[Line " << token.line << "] Error";
        if (m_use_color) m_out << RESET;

        if (token.type == TokenType::EOF_TOKEN && token.lexeme.empty()) {
            m_out << " at end";
        } else {
            m_out << " at '" << token.lexeme << "'";
        }
        m_out << ": " << message << std::endl;

        printSourceLine(token, RED);
    }

    void ErrorHandler::report(const SpiError &error) {
        report(error.token(), to_string(error.kind()) + ": " + error.what());
    }

    void ErrorHandler::note(const Token &token, const std::string &message) {
        // A note is supplemental, so it does not set m_hadError.
        if (m_use_color) m_out << BOLD << CYAN;
        m_out << "[Line " << token.line << "] note: ";
        if (m_use_color) m_out << RESET;
        m_out << message << std::endl;

        printSourceLine(token, CYAN);
    }

    void ErrorHandler::printSourceLine(const Token &token, const char *color) {
        if (token.line <= 0 || static_cast<size_t>(token.line - 1) >= m_lines.size()) {
            return;
        }

        m_out << " " << token.line << " | " << m_lines[token.line - 1] << std::endl;

        // The pointer line, e.g. "   |     ^^^"
        std::string pointer;
        pointer += "   | " + std::string(token.column > 0 ? token.column - 1 : 0, ' ');
        pointer += std::string(token.lexeme.length() > 0 ? token.lexeme.length() : 1, '^');
        if (m_use_color) {
            m_out << BOLD << color << pointer << RESET << std::endl;
        } else {
            m_out << pointer << std::endl;
        }
    }

    bool ErrorHandler::hadError() const {
        return m_hadError;
    }

    void ErrorHandler::clearError() {
        m_hadError = false;
    }
}

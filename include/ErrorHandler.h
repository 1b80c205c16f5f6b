#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "Token.h"
#include "Errors.h"

namespace spi {
    class ErrorHandler {
    public:
        virtual ~ErrorHandler() = default;

        explicit ErrorHandler(const std::string &source, std::ostream &out = std::cerr, bool use_color = true);

        virtual void report(const Token &token, const std::string &message);
        virtual void note(const Token &token, const std::string &message);

        // Reports a pipeline failure, prefixing the message with its kind.
        virtual void report(const SpiError &error);

        bool hadError() const;

        void clearError();

    protected:
        void markError() { m_hadError = true; }

        // Prints the offending source line with a caret marker under the token.
        void printSourceLine(const Token &token, const char *color);

    private:
        std::vector<std::string> m_lines;
        std::ostream &m_out;
        bool m_use_color;
        bool m_hadError = false;
    };
}

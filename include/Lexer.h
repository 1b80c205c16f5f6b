#pragma once

#include <string>
#include <vector>
#include <map>
#include "Token.h"
#include "Errors.h"

namespace spi {

    class Lexer {
    public:
        // Constructor takes the source code to be scanned
        explicit Lexer(std::string source);

        // Returns the next token. Once the input is exhausted, every call
        // returns an EOF token.
        Token getNextToken();

        // Scans from the beginning of the source and returns every token up to
        // and including EOF. Does not disturb the getNextToken() position.
        std::vector<Token> scanTokens() const;

    private:
        // Helper methods for the scanning process
        bool isAtEnd() const;
        char advance();
        char peek() const;
        void skipWhitespace();
        void skipComment();
        Token number();
        Token identifier();
        Token makeToken(TokenType type, TokenValue value = {}) const;
        [[noreturn]] void error(ErrorKind kind, const std::string &message) const;

        const std::string m_source;
        size_t m_start = 0;
        size_t m_current = 0;
        int m_line = 1;
        int m_column = 1;
        int m_start_line = 1;
        int m_start_column = 1;

        // Map to hold all reserved keywords
        static const std::map<std::string, TokenType> keywords;
    };
}

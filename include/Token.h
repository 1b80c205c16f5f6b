#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace spi {

    enum class TokenType {
        // Keywords
        PROGRAM, PROCEDURE, VAR, INTEGER, REAL, BEGIN, END,

        // Literals
        INTEGER_CONST, REAL_CONST, ID,

        // Single-character tokens
        LPAREN, RPAREN, PLUS, MINUS, MUL, FLOAT_DIV,
        SEMI, COLON, COMMA, DOT,

        // DIV keyword
        INTEGER_DIV,

        // Two-character operators
        ASSIGN,

        // End of File
        EOF_TOKEN,
    };

    std::string to_string(const TokenType &type);

    // Literal payload: integer, real, identifier/keyword text, or nothing.
    using TokenValue = std::variant<std::monostate, int64_t, double, std::string>;

    struct Token {
        TokenType type = TokenType::EOF_TOKEN;
        std::string lexeme;
        TokenValue value;
        int line{};
        int column{};

        Token() = default;

        Token(TokenType type, std::string lexeme, TokenValue value, int line, int column)
                : type(type), lexeme(std::move(lexeme)), value(std::move(value)), line(line), column(column) {}

        // The identifier text (uppercased) for ID and keyword tokens, empty otherwise.
        std::string text() const;

        // Token(INTEGER_CONST, 3), Token(ID, 'ALPHA'), Token(EOF_TOKEN, None)
        std::string toString() const;
    };

}

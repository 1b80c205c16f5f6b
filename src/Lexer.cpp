#include "Lexer.h"
#include "Errors.h"
#include "Logger.h"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace spi {
// Initialize the static keywords map. DIV is spelled as a keyword but is the
// integer division operator.
    const std::map<std::string, TokenType> Lexer::keywords = {
            {"PROGRAM",   TokenType::PROGRAM},
            {"VAR",       TokenType::VAR},
            {"DIV",       TokenType::INTEGER_DIV},
            {"INTEGER",   TokenType::INTEGER},
            {"REAL",      TokenType::REAL},
            {"BEGIN",     TokenType::BEGIN},
            {"END",       TokenType::END},
            {"PROCEDURE", TokenType::PROCEDURE},
    };

    Lexer::Lexer(std::string source) : m_source(std::move(source)) {}

    std::vector<Token> Lexer::scanTokens() const {
        Lexer scanner(m_source);
        std::vector<Token> tokens;
        while (true) {
            tokens.push_back(scanner.getNextToken());
            if (tokens.back().type == TokenType::EOF_TOKEN) break;
        }
        SPI_LOG("lexer: scanned " + std::to_string(tokens.size()) + " tokens");
        return tokens;
    }

// Helper functions
    static bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    static bool isAlpha(char c) {
        return (c >= 'a' && c <= 'z') ||
               (c >= 'A' && c <= 'Z') ||
               c == '_';
    }

    static bool isAlphaNumeric(char c) {
        return isAlpha(c) || isDigit(c);
    }

    // Printable ASCII as-is, anything else (control bytes, pieces of a UTF-8
    // sequence) as \xNN.
    static std::string describe(char c) {
        auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x20 && byte < 0x7f) {
            return std::string(1, c);
        }
        static const char *const hex = "0123456789ABCDEF";
        return std::string("\\x") + hex[byte >> 4] + hex[byte & 0x0f];
    }

    bool Lexer::isAtEnd() const {
        return m_current >= m_source.length();
    }

    char Lexer::advance() {
        char c = m_source[m_current++];
        if (c == '\n') {
            m_line++;
            m_column = 1;
        } else {
            m_column++;
        }
        return c;
    }

    char Lexer::peek() const {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    Token Lexer::makeToken(TokenType type, TokenValue value) const {
        std::string text = m_source.substr(m_start, m_current - m_start);
        return Token(type, std::move(text), std::move(value), m_start_line, m_start_column);
    }

    void Lexer::error(ErrorKind kind, const std::string &message) const {
        Token offending(TokenType::EOF_TOKEN, m_source.substr(m_start, m_current - m_start),
                        std::monostate{}, m_start_line, m_start_column);
        throw SpiError(kind, std::move(offending), message);
    }

    void Lexer::skipWhitespace() {
        while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    void Lexer::skipComment() {
        // The opening '{' has already been consumed. Comments do not nest.
        while (!isAtEnd() && peek() != '}') {
            advance();
        }

        if (isAtEnd()) {
            m_current = m_start + 1; // point the diagnostic at the '{'
            error(ErrorKind::UnterminatedComment, "Unterminated comment.");
        }

        advance(); // Consume the closing '}'.
    }

    Token Lexer::number() {
        while (isDigit(peek())) advance();

        // A '.' right after the digits starts the fractional part.
        bool is_real = false;
        if (peek() == '.') {
            is_real = true;
            advance();
            while (isDigit(peek())) advance();
        }

        std::string text = m_source.substr(m_start, m_current - m_start);
        try {
            if (is_real) {
                return makeToken(TokenType::REAL_CONST, std::stod(text));
            }
            return makeToken(TokenType::INTEGER_CONST, static_cast<int64_t>(std::stoll(text)));
        } catch (const std::out_of_range &) {
            error(ErrorKind::InvalidSyntax, "Numeric literal '" + text + "' is out of range.");
        }
    }

    Token Lexer::identifier() {
        while (isAlphaNumeric(peek())) advance();

        std::string text = m_source.substr(m_start, m_current - m_start);
        for (char &c : text) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }

        // Check if the identifier is a reserved keyword
        auto it = keywords.find(text);
        if (it == keywords.end()) {
            return makeToken(TokenType::ID, text);
        }
        return makeToken(it->second, text);
    }

    Token Lexer::getNextToken() {
        while (true) {
            skipWhitespace();

            m_start = m_current;
            m_start_line = m_line;
            m_start_column = m_column;

            if (isAtEnd()) {
                return Token(TokenType::EOF_TOKEN, "", std::monostate{}, m_line, m_column);
            }

            char c = advance();
            switch (c) {
                case '{':
                    skipComment();
                    continue;

                case ':':
                    if (peek() == '=') {
                        advance();
                        return makeToken(TokenType::ASSIGN);
                    }
                    return makeToken(TokenType::COLON);

                // Single-character tokens
                case ';': return makeToken(TokenType::SEMI);
                case ',': return makeToken(TokenType::COMMA);
                case '+': return makeToken(TokenType::PLUS);
                case '-': return makeToken(TokenType::MINUS);
                case '*': return makeToken(TokenType::MUL);
                case '/': return makeToken(TokenType::FLOAT_DIV);
                case '(': return makeToken(TokenType::LPAREN);
                case ')': return makeToken(TokenType::RPAREN);
                case '.': return makeToken(TokenType::DOT);

                default:
                    if (isDigit(c)) return number();
                    if (isAlpha(c)) return identifier();
                    error(ErrorKind::InvalidCharacter, "Unexpected character '" + describe(c) + "'.");
            }
        }
    }

}

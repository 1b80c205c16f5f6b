#include "Token.h"

#include <sstream>

namespace spi {

    std::string to_string(const TokenType &type) {
        // This array matches the order of the TokenType enum in Token.h
        static const char *const names[] = {
                // Keywords
                "PROGRAM", "PROCEDURE", "VAR", "INTEGER", "REAL", "BEGIN", "END",

                // Literals
                "INTEGER_CONST", "REAL_CONST", "ID",

                // Single-character tokens
                "LPAREN", "RPAREN", "PLUS", "MINUS", "MUL", "FLOAT_DIV",
                "SEMI", "COLON", "COMMA", "DOT",

                "INTEGER_DIV",
                "ASSIGN",
                "EOF"
        };

        // Safety check in case the enum and array get out of sync
        int index = static_cast<int>(type);
        if (index >= 0 && index < static_cast<int>(sizeof(names) / sizeof(names[0]))) {
            return names[index];
        }

        return "[[UNKNOWN_TOKEN]]";
    }

    std::string Token::text() const {
        if (const auto *s = std::get_if<std::string>(&value)) {
            return *s;
        }
        return "";
    }

    std::string Token::toString() const {
        std::stringstream ss;
        ss << "Token(" << to_string(type) << ", ";
        if (std::holds_alternative<int64_t>(value)) {
            ss << std::get<int64_t>(value);
        } else if (std::holds_alternative<double>(value)) {
            ss << std::get<double>(value);
        } else if (std::holds_alternative<std::string>(value)) {
            ss << "'" << std::get<std::string>(value) << "'";
        } else {
            ss << "None";
        }
        ss << ")";
        return ss.str();
    }

}

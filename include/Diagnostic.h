#ifndef SPI_DIAGNOSTIC_H
#define SPI_DIAGNOSTIC_H

#include <optional>
#include <string>
#include "Token.h"
#include "Errors.h"

namespace spi {

    // Represents the severity of a diagnostic message.
    enum class DiagnosticSeverity {
        Error = 1,
        Warning = 2,
        Information = 3,
        Hint = 4
    };

    // Represents a range in the source text. 0-indexed.
    struct Range {
        int start_line;
        int start_char;
        int end_line;
        int end_char;
    };

    // Represents a diagnostic, such as a syntax or runtime error.
    struct Diagnostic {
        Range range;
        DiagnosticSeverity severity;
        std::string message;
        // Set for errors raised by the pipeline, empty for free-form reports.
        std::optional<ErrorKind> kind;
    };

    // Helper function to create a Diagnostic directly from a Token.
    inline Diagnostic create_diagnostic_from_token(const Token& token, const std::string& message,
                                                   DiagnosticSeverity severity) {
        // Diagnostic positions are 0-indexed, while Tokens are 1-indexed.
        int line = token.line > 0 ? token.line - 1 : 0;
        int start_char = token.column > 0 ? token.column - 1 : 0;
        int end_char = start_char + static_cast<int>(token.lexeme.length());

        // For single-token errors, the range is on the same line.
        return Diagnostic{
            {line, start_char, line, end_char},
            severity,
            message,
            std::nullopt
        };
    }

} // namespace spi

#endif // SPI_DIAGNOSTIC_H

#pragma once

#include <stdexcept>
#include <string>
#include "Token.h"

namespace spi {

    // The failure kinds a run can end with. The first error aborts the run.
    enum class ErrorKind {
        InvalidCharacter,
        UnterminatedComment,
        InvalidSyntax,
        DuplicateIdentifier,
        UndeclaredIdentifier,
        UndefinedVariable,
        DivisionByZero,
        IntegerOverflow,
    };

    std::string to_string(ErrorKind kind);

    /**
     * @class SpiError
     * @brief Thrown by every pipeline stage. Carries the failure kind and the
     *        token the failure was detected at.
     */
    class SpiError : public std::runtime_error {
    public:
        SpiError(ErrorKind kind, Token token, const std::string &message)
                : std::runtime_error(message), m_kind(kind), m_token(std::move(token)) {}

        ErrorKind kind() const { return m_kind; }
        const Token &token() const { return m_token; }

    private:
        ErrorKind m_kind;
        Token m_token;
    };

} // namespace spi

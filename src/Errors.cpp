#include "Errors.h"

namespace spi {

    std::string to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidCharacter:     return "InvalidCharacter";
            case ErrorKind::UnterminatedComment:  return "UnterminatedComment";
            case ErrorKind::InvalidSyntax:        return "InvalidSyntax";
            case ErrorKind::DuplicateIdentifier:  return "DuplicateIdentifier";
            case ErrorKind::UndeclaredIdentifier: return "UndeclaredIdentifier";
            case ErrorKind::UndefinedVariable:    return "UndefinedVariable";
            case ErrorKind::DivisionByZero:       return "DivisionByZero";
            case ErrorKind::IntegerOverflow:      return "IntegerOverflow";
        }
        return "UnknownError";
    }

} // namespace spi

#include "CollectingErrorHandler.h"

namespace spi {

    CollectingErrorHandler::CollectingErrorHandler(const std::string &source)
            : ErrorHandler(source, std::cerr, false) {}

    void CollectingErrorHandler::report(const Token& token, const std::string& message) {
        markError();
        m_diagnostics.push_back(
            create_diagnostic_from_token(token, message, DiagnosticSeverity::Error)
        );
    }

    void CollectingErrorHandler::report(const SpiError& error) {
        markError();
        Diagnostic diagnostic = create_diagnostic_from_token(error.token(), error.what(), DiagnosticSeverity::Error);
        diagnostic.kind = error.kind();
        m_diagnostics.push_back(std::move(diagnostic));
    }

    void CollectingErrorHandler::note(const Token& token, const std::string& message) {
        // Notes are kept as separate diagnostics with Information severity.
        m_diagnostics.push_back(
            create_diagnostic_from_token(token, message, DiagnosticSeverity::Information)
        );
    }

    const std::vector<Diagnostic>& CollectingErrorHandler::get_diagnostics() const {
        return m_diagnostics;
    }

} // namespace spi

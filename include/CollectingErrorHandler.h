#ifndef SPI_COLLECTINGERRORHANDLER_H
#define SPI_COLLECTINGERRORHANDLER_H

#include "ErrorHandler.h"
#include "Diagnostic.h"
#include <vector>

namespace spi {

    // Records structured diagnostics instead of printing them.
    class CollectingErrorHandler : public ErrorHandler {
    public:
        explicit CollectingErrorHandler(const std::string &source);

        // Override the core reporting methods.
        void report(const Token& token, const std::string& message) override;
        void report(const SpiError& error) override;
        void note(const Token& token, const std::string& message) override;

        const std::vector<Diagnostic>& get_diagnostics() const;

    private:
        std::vector<Diagnostic> m_diagnostics;
    };

} // namespace spi

#endif // SPI_COLLECTINGERRORHANDLER_H
